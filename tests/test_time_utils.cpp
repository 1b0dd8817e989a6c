//
// Created by Giuseppe Francione on 14/10/26.
//

#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../libdatacat/include/time_utils.hpp"

using namespace datacat;
using namespace std::chrono;

TEST(TimeUtils, ParsesWrfFileNameStamp) {
    const auto t = parse_time("2019-05-28_120500", "%Y-%m-%d_%H%M%S");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(format_time(*t), "2019-05-28 12:05:00");
}

TEST(TimeUtils, ParsesCompactDwdStamp) {
    const auto t = parse_time("20190601235959", "%Y%m%d%H%M%S");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(format_time(*t), "2019-06-01 23:59:59");
}

TEST(TimeUtils, UnixRoundTripIsUtc) {
    const auto t = parse_time("1970-01-02 00:00:01", "%Y-%m-%d %H:%M:%S");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(to_unix(*t), 86401);
    EXPECT_EQ(from_unix(86401), *t);
}

TEST(TimeUtils, RejectsImpossibleDates) {
    EXPECT_FALSE(parse_time("2019-02-30_120000", "%Y-%m-%d_%H%M%S").has_value());
    EXPECT_FALSE(parse_time("2019-13-01_120000", "%Y-%m-%d_%H%M%S").has_value());
}

TEST(TimeUtils, RejectsTrailingText) {
    EXPECT_FALSE(parse_time("2019-05-28_120000x", "%Y-%m-%d_%H%M%S").has_value());
    EXPECT_FALSE(parse_time("not a time", "%Y-%m-%d_%H%M%S").has_value());
}

TEST(TimeUtils, UserTimeAcceptsConfigAndIsoForms) {
    const auto expected = test::at("2019-05-28 12:00:00");
    EXPECT_EQ(parse_user_time("28.05.2019 12:00:00"), expected);
    EXPECT_EQ(parse_user_time("2019-05-28T12:00:00"), expected);
    EXPECT_EQ(parse_user_time("2019-05-28 12:00:00"), expected);
    EXPECT_FALSE(parse_user_time("28/05/2019").has_value());
}

TEST(TimeUtils, ModificationTimeOfMissingFileIsEmpty) {
    const test::TempDir dir;
    EXPECT_FALSE(modification_time(dir.path() / "missing").has_value());
}

TEST(TimeUtils, ModificationTimeFollowsTheFile) {
    const test::TempDir dir;
    const auto file = test::write_file(dir.path() / "a.pri", "x");
    const auto before = modification_time(file);
    ASSERT_TRUE(before.has_value());

    test::touch_future(file, seconds{60});
    const auto after = modification_time(file);
    ASSERT_TRUE(after.has_value());
    EXPECT_GT(*after, *before);
    EXPECT_GT(*after, now_watermark());
}
