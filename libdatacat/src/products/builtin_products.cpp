//
// Created by Giuseppe Francione on 06/10/26.
//

#include "../../include/layout_parser.hpp"
#include "../../include/product_registry.hpp"
#include <memory>

namespace datacat {

namespace {

constexpr auto kModelTimePattern = R"(^(\d{4}-\d{2}-\d{2}_\d{6}))";
constexpr auto kModelTimeFormat = "%Y-%m-%d_%H%M%S";
constexpr auto kModelNamePattern = R"(^\d{4}-\d{2}-\d{2}_\d{6}\.nc$)";

/// Products written by the processing chain: one <time>.nc per time step.
ProductSchema make_netcdf_product(std::string name,
                                  std::string description,
                                  std::vector<Field> required,
                                  std::vector<Field> optional) {
    ProductSchema p;
    p.name = std::move(name);
    p.description = std::move(description);
    p.kinds = KindTable(std::vector<KindRule>{{"data", "data", "", ".nc", kModelNamePattern}});
    p.fields = required;
    p.fields.insert(p.fields.end(), optional.begin(), optional.end());
    p.reference = default_reference_data();

    LayoutParser::Options opt;
    opt.name = p.name + "-layout";
    opt.time_pattern = kModelTimePattern;
    opt.time_format = kModelTimeFormat;
    opt.required = std::move(required);
    opt.optional = std::move(optional);
    opt.reference = p.reference;
    p.parser = std::make_shared<LayoutParser>(std::move(opt));
    p.loader = raw_file_loader();
    return p;
}

} // namespace

std::vector<ReferenceValue> default_reference_data() {
    std::vector<ReferenceValue> ref = {
        {"mp_scheme", "8", "Thompson"},
        {"mp_scheme", "10", "Morrison"},
        {"mp_scheme", "28", "Thompson Aerosol Aware"},
        {"mp_scheme", "30", "Fast Spectral Bin"},
        {"mp_scheme", "50", "P3"},
        {"domain", "d01", "Europe"},
        {"domain", "d02", "Germany"},
        {"domain", "d03", "Munich"},
        {"radar", "Isen", "Isen"},
        {"source", "DWD", "DWD"},
        {"source", "MODEL", "MODEL"},
        {"method", "Dolan", "Dolan"},
    };
    for (const char* hm : {"cloud", "ice", "rain", "snow", "graupel",
                           "parimedice", "smallice", "unrimedice", "all"}) {
        ref.push_back({"hydrometeor", hm, hm});
    }
    return ref;
}

ProductSchema make_wrf_product() {
    ProductSchema p;
    p.name = "wrf";
    p.description = "WRF model output (wrfout, wrfmp, clouds)";

    std::vector<KindRule> rules;
    for (const char* kind : {"wrfout", "wrfmp", "clouds"}) {
        const std::string k = kind;
        rules.push_back({k, k, k, "", "^" + k + R"(_d0[1-9]_\d{4}-\d{2}-\d{2}_\d{6}(\..*)?$)"});
    }
    p.kinds = KindTable(std::move(rules));
    p.fields = {Field::MpId, Field::Domain};
    p.reference = default_reference_data();

    LayoutParser::Options opt;
    opt.name = "wrf-layout";
    opt.time_pattern = R"(_(\d{4}-\d{2}-\d{2}_\d{6}))";
    opt.time_format = kModelTimeFormat;
    opt.domain_pattern = R"(_(d0[1-9])_)";
    opt.required = {Field::MpId, Field::Domain};
    opt.reference = p.reference;
    p.parser = std::make_shared<LayoutParser>(std::move(opt));
    p.loader = raw_file_loader();
    return p;
}

ProductSchema make_crsim_product() {
    return make_netcdf_product("crsim", "CR-SIM simulated radar variables",
                               {Field::MpId, Field::Radar, Field::Hydrometeor}, {});
}

ProductSchema make_rf_product() {
    return make_netcdf_product("rf", "Simulated reflectivity on the radar grid",
                               {Field::MpId, Field::Radar}, {});
}

ProductSchema make_rg_product() {
    return make_netcdf_product("rg", "Radar data regridded to the Cartesian grid",
                               {Field::Source, Field::Radar}, {Field::MpId});
}

ProductSchema make_hmc_product() {
    return make_netcdf_product("hmc", "Hydrometeor classification",
                               {Field::Source, Field::Method}, {Field::MpId});
}

ProductSchema make_temp_product() {
    return make_netcdf_product("temp", "Model temperature on the radar grid",
                               {Field::MpId}, {});
}

ProductSchema make_dwd_product() {
    ProductSchema p;
    p.name = "dwd";
    p.description = "DWD radar volume archive (Isen)";
    // the 2019-05-28 archive file is known to be broken
    p.kinds = KindTable(std::vector<KindRule>{{"volume", "volume", "", ".hd5", R"(^.*\d{14}.*\.hd5$)"}},
                        {"20190528.hd5"});
    p.fields = {Field::Radar};
    p.reference = default_reference_data();

    LayoutParser::Options opt;
    opt.name = "dwd-layout";
    opt.time_pattern = R"((\d{14}))";
    opt.time_format = "%Y%m%d%H%M%S";
    opt.required = {Field::Radar};
    opt.constants = {{Field::Radar, "Isen"}};
    opt.reference = p.reference;
    p.parser = std::make_shared<LayoutParser>(std::move(opt));
    p.loader = raw_file_loader();
    return p;
}

} // namespace datacat
