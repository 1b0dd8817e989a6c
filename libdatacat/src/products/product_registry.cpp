//
// Created by Giuseppe Francione on 06/10/26.
//

#include "../../include/product_registry.hpp"
#include <algorithm>
#include <cctype>

namespace datacat {

ProductRegistry::ProductRegistry() {
    products_.push_back(make_wrf_product());
    products_.push_back(make_crsim_product());
    products_.push_back(make_rf_product());
    products_.push_back(make_rg_product());
    products_.push_back(make_hmc_product());
    products_.push_back(make_temp_product());
    products_.push_back(make_dwd_product());
}

const ProductSchema* ProductRegistry::find(const std::string_view name) const {
    const auto eq = [](const std::string_view a, const std::string_view b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](const unsigned char x, const unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    };
    const auto it = std::find_if(products_.begin(), products_.end(),
                                 [&](const ProductSchema& p) { return eq(p.name, name); });
    return it != products_.end() ? &*it : nullptr;
}

} // namespace datacat
