//
// Created by Giuseppe Francione on 15/10/26.
//

#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../libdatacat/include/layout_parser.hpp"
#include "../libdatacat/include/mime_detector.hpp"
#include "../libdatacat/include/product_registry.hpp"

using namespace datacat;
using namespace datacat::test;

namespace {

ParsedFile parse_with(const ProductSchema& product, const fs::path& root, const fs::path& file) {
    const auto match = product.kinds.classify(file);
    if (match.status != Classification::Accepted) {
        throw std::runtime_error("test file not accepted: " + match.reason);
    }
    return product.parser->parse(ParseRequest{file, file.lexically_relative(root), *match.rule});
}

} // namespace

TEST(LayoutParser, WrfKeysFromSchemeDirectoryAndDomainCode) {
    const TempDir dir;
    const auto product = make_wrf_product();
    const auto file = write_file(dir.path() / "MP8" / "wrfout_d03_2019-05-28_120000", "netcdf");

    const auto parsed = parse_with(product, dir.path(), file);
    EXPECT_EQ(parsed.role, "wrfout");
    EXPECT_EQ(parsed.key.time, at("2019-05-28 12:00:00"));
    EXPECT_EQ(parsed.key.end_time, parsed.key.time);
    EXPECT_EQ(parsed.key.mp_id, 8);
    EXPECT_EQ(parsed.key.domain, "Munich");
    EXPECT_FALSE(parsed.key.radar.has_value());
}

TEST(LayoutParser, CrsimKeysFromOutputLayout) {
    const TempDir dir;
    const auto product = make_crsim_product();
    const auto file = write_file(dir.path() / "MP28" / "Isen" / "graupel" / "2019" / "05" / "28" /
                                 "2019-05-28_121500.nc", "netcdf");

    const auto parsed = parse_with(product, dir.path(), file);
    EXPECT_EQ(parsed.role, "data");
    EXPECT_EQ(parsed.key.time, at("2019-05-28 12:15:00"));
    EXPECT_EQ(parsed.key.mp_id, 28);
    EXPECT_EQ(parsed.key.radar, "Isen");
    EXPECT_EQ(parsed.key.hydrometeor, "graupel");
}

TEST(LayoutParser, OptionalSchemeMayBeAbsent) {
    const TempDir dir;
    const auto product = make_rg_product();
    const auto file = write_file(dir.path() / "DWD" / "Isen" / "2019-05-28_120000.nc", "netcdf");

    const auto parsed = parse_with(product, dir.path(), file);
    EXPECT_EQ(parsed.key.source, "DWD");
    EXPECT_EQ(parsed.key.radar, "Isen");
    EXPECT_FALSE(parsed.key.mp_id.has_value());
}

TEST(LayoutParser, DwdRadarIsConstant) {
    const TempDir dir;
    const auto product = make_dwd_product();
    const auto file = write_file(dir.path() / "2019" / "ras07-vol5minng01_sweeph5onem_allmoms_00-20190601120500-isn.hd5",
                                 "hdf5");

    const auto parsed = parse_with(product, dir.path(), file);
    EXPECT_EQ(parsed.role, "volume");
    EXPECT_EQ(parsed.key.time, at("2019-06-01 12:05:00"));
    EXPECT_EQ(parsed.key.radar, "Isen");
}

TEST(LayoutParser, MissingRequiredFieldFails) {
    const TempDir dir;
    const auto product = make_crsim_product();
    // no hydrometeor directory
    const auto file = write_file(dir.path() / "MP8" / "Isen" / "2019-05-28_120000.nc", "netcdf");
    EXPECT_THROW((void)parse_with(product, dir.path(), file), ParseError);
}

TEST(LayoutParser, UnknownSchemeFails) {
    const TempDir dir;
    const auto product = make_wrf_product();
    const auto file = write_file(dir.path() / "MP99" / "wrfout_d03_2019-05-28_120000", "netcdf");
    EXPECT_THROW((void)parse_with(product, dir.path(), file), ParseError);
}

TEST(LayoutParser, EmptyFileFails) {
    const TempDir dir;
    const auto product = make_wrf_product();
    const auto file = write_file(dir.path() / "MP8" / "wrfmp_d01_2019-05-28_120000", "");
    EXPECT_THROW((void)parse_with(product, dir.path(), file), ParseError);
}

TEST(LayoutParser, MimeAttributeComesFromOneDetection) {
    const TempDir dir;
    const auto product = make_wrf_product();
    const auto file = write_file(dir.path() / "MP8" / "wrfout_d03_2019-05-28_120000", "netcdf");

    const auto parsed = parse_with(product, dir.path(), file);
    const std::string mime = MimeDetector::detect(file);
    if (mime.empty()) {
        EXPECT_FALSE(parsed.attributes.contains("mime_wrfout"));
    } else {
        ASSERT_TRUE(parsed.attributes.contains("mime_wrfout"));
        EXPECT_EQ(parsed.attributes.at("mime_wrfout"), mime);
    }
}

TEST(MimeDetector, EmptyTypes) {
    EXPECT_TRUE(MimeDetector::is_empty_type("inode/x-empty"));
    EXPECT_TRUE(MimeDetector::is_empty_type("application/x-empty"));
    EXPECT_FALSE(MimeDetector::is_empty_type("text/plain"));
    EXPECT_FALSE(MimeDetector::is_empty_type(""));
}

TEST(LayoutParser, SchemeAboveRootIsIgnored) {
    const TempDir dir;
    const auto product = make_wrf_product();
    const fs::path root = dir.path() / "MP8" / "run";
    const auto file = write_file(root / "wrfout_d02_2019-05-28_120000", "netcdf");
    EXPECT_THROW((void)parse_with(product, root, file), ParseError);
}
