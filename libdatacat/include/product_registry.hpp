//
// Created by Giuseppe Francione on 06/10/26.
//

/**
 * @file product_registry.hpp
 * @brief Registry of the built-in products.
 */

#ifndef DATACAT_PRODUCT_REGISTRY_HPP
#define DATACAT_PRODUCT_REGISTRY_HPP

#include "product.hpp"
#include <string_view>
#include <vector>

namespace datacat {

/**
 * @brief Owns one ProductSchema per built-in product.
 *
 * @details Instantiated once per execution; the CLI uses it to resolve the
 * @c --product option, library users may also build their own ProductSchema.
 */
class ProductRegistry {
public:
    /**
     * @brief Construct and register all built-in products
     * (wrf, crsim, rf, rg, hmc, temp, dwd).
     */
    ProductRegistry();

    /**
     * @brief Find a product by name (case-insensitive).
     * @return Non-owning pointer, nullptr if unknown.
     */
    [[nodiscard]] const ProductSchema* find(std::string_view name) const;

    [[nodiscard]] const std::vector<ProductSchema>& all() const { return products_; }

private:
    std::vector<ProductSchema> products_;
};

/// Reference data shared by every built-in product.
std::vector<ReferenceValue> default_reference_data();

ProductSchema make_wrf_product();    ///< WRF model output: wrfout, wrfmp and clouds files
ProductSchema make_crsim_product();  ///< CR-SIM forward-operator output
ProductSchema make_rf_product();     ///< simulated reflectivity
ProductSchema make_rg_product();     ///< regridded radar data
ProductSchema make_hmc_product();    ///< hydrometeor classification
ProductSchema make_temp_product();   ///< temperature fields
ProductSchema make_dwd_product();    ///< DWD radar volume archive

} // namespace datacat

#endif // DATACAT_PRODUCT_REGISTRY_HPP
