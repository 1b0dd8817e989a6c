//
// Created by Giuseppe Francione on 16/10/26.
//

#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../libdatacat/include/catalog.hpp"
#include "../libdatacat/include/loader.hpp"
#include "../libdatacat/include/result_handle.hpp"

using namespace datacat;
using namespace datacat::test;

namespace {

DatasetRecord sample_record(const fs::path& dir) {
    DatasetRecord rec;
    rec.id = 1;
    rec.key.time = at("2019-05-28 12:00:00");
    rec.key.end_time = rec.key.time;
    rec.key.mp_id = 8;
    rec.key.radar = "Isen";
    rec.roles["primary"] = FileRecord{1, write_file(dir / "a.pri", "abc"), "primary", {}};
    rec.roles["companionA"] = FileRecord{2, write_file(dir / "a.ca", "de"), "companionA", {}};
    rec.attributes["units"] = "dBZ";
    rec.attributes["radar"] = "shadowed";
    return rec;
}

} // namespace

TEST(ResultHandle, ExposesIdentityAndAttributes) {
    const TempDir dir;
    const auto h = ResultHandle::from_record(sample_record(dir.path()), raw_file_loader());

    EXPECT_EQ(h.time(), at("2019-05-28 12:00:00"));
    EXPECT_EQ(std::get<std::int64_t>(*h.attribute("mp_id")), 8);
    EXPECT_EQ(std::get<std::string>(*h.attribute("radar")), "Isen");
    EXPECT_EQ(std::get<std::string>(*h.attribute("units")), "dBZ");
    EXPECT_EQ(std::get<TimePoint>(*h.attribute("end_time")), h.time());
    EXPECT_FALSE(h.attribute("domain").has_value());
    EXPECT_EQ(h.files().size(), 2u);
    EXPECT_EQ(h.file("primary"), dir.path() / "a.pri");
    EXPECT_FALSE(h.file("companionB").has_value());
}

TEST(ResultHandle, LoadPassesResolvedPaths) {
    const TempDir dir;
    const auto h = ResultHandle::from_record(sample_record(dir.path()), raw_file_loader());

    const Dataset ds = h.load();
    const auto& raw = std::any_cast<const RawFiles&>(ds.data);
    EXPECT_EQ(raw.total_bytes(), 5u);
    EXPECT_EQ(ds.files, h.files());
    EXPECT_EQ(ds.attributes.size(), h.attributes().size());
}

TEST(ResultHandle, DeletedFileFailsWithLoadError) {
    const TempDir dir;
    const auto h = ResultHandle::from_record(sample_record(dir.path()), raw_file_loader());
    fs::remove(dir.path() / "a.ca");

    try {
        (void)h.load();
        FAIL() << "expected LoadError";
    } catch (const LoadError& e) {
        bool nested = false;
        try {
            std::rethrow_if_nested(e);
        } catch (const std::runtime_error&) {
            nested = true;
        }
        EXPECT_TRUE(nested);
    }
}

TEST(ResultHandle, LoaderFailureIsWrapped) {
    const TempDir dir;
    const Loader failing = [](const FileMap&) -> std::any { throw std::out_of_range("truncated"); };
    const auto h = ResultHandle::from_record(sample_record(dir.path()), failing);

    try {
        (void)h.load();
        FAIL() << "expected LoadError";
    } catch (const LoadError& e) {
        EXPECT_NE(std::string(e.what()).find("truncated"), std::string::npos);
        EXPECT_THROW(std::rethrow_if_nested(e), std::out_of_range);
    }
}

TEST(ResultHandle, MissingLoaderFails) {
    const TempDir dir;
    const auto h = ResultHandle::from_record(sample_record(dir.path()), Loader{});
    EXPECT_THROW((void)h.load(), LoadError);
}

TEST(ResultHandle, OutlivesClosedCatalog) {
    const TempDir dir;
    write_file(dir.path() / "data" / "a.pri", "time=2019-05-28 12:00:00\nmp=8\nradar=Isen\n");

    std::vector<ResultHandle> handles;
    {
        auto catalog = Catalog::open(dir.path() / "data", dir.path() / "catalog.db", make_test_product());
        handles = catalog.latest(1);
        catalog.close();
    }
    ASSERT_EQ(handles.size(), 1u);
    EXPECT_EQ(std::get<std::int64_t>(*handles[0].attribute("mp_id")), 8);
    EXPECT_NO_THROW((void)handles[0].load());
}
