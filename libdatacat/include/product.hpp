//
// Created by Giuseppe Francione on 05/10/26.
//

/**
 * @file product.hpp
 * @brief Static description of one product: kinds, identity fields, reference data, adapters.
 */

#ifndef DATACAT_PRODUCT_HPP
#define DATACAT_PRODUCT_HPP

#include "file_kind.hpp"
#include "loader.hpp"
#include "parser.hpp"
#include "records.hpp"
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace datacat {

/**
 * @brief Everything the catalog needs to know about a product.
 *
 * A catalog is bound to exactly one ProductSchema for its lifetime.
 */
struct ProductSchema {
    std::string name;                          ///< e.g. "wrf", "dwd"
    std::string description;
    KindTable kinds;
    std::vector<Field> fields;                 ///< descriptive fields usable as query filters
    std::vector<ReferenceValue> reference;     ///< seeded into the store on creation
    std::shared_ptr<const IParser> parser;
    Loader loader;

    [[nodiscard]] bool supports(Field field) const {
        return std::find(fields.begin(), fields.end(), field) != fields.end();
    }
};

} // namespace datacat

#endif // DATACAT_PRODUCT_HPP
