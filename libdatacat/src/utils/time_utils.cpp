//
// Created by Giuseppe Francione on 03/10/26.
//

#include "../../include/time_utils.hpp"
#include <array>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <system_error>

namespace datacat {

using namespace std::chrono;

std::optional<TimePoint> parse_time(const std::string_view text, const std::string& format) {
    std::tm tm{};
    std::istringstream in{std::string(text)};
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, format.c_str());
    if (in.fail()) return std::nullopt;
    // trailing characters mean the text is longer than the format
    if (in.peek() != std::char_traits<char>::eof()) return std::nullopt;

    const year_month_day ymd{year{tm.tm_year + 1900},
                             month{static_cast<unsigned>(tm.tm_mon + 1)},
                             day{static_cast<unsigned>(tm.tm_mday)}};
    if (!ymd.ok()) return std::nullopt;
    if (tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59) return std::nullopt;

    return TimePoint{sys_days{ymd}} + hours{tm.tm_hour} + minutes{tm.tm_min} + seconds{tm.tm_sec};
}

std::optional<TimePoint> parse_user_time(const std::string_view text) {
    static const std::array<const char*, 3> formats = {
        "%d.%m.%Y %H:%M:%S",
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M:%S",
    };
    for (const char* fmt : formats) {
        if (auto t = parse_time(text, fmt)) return t;
    }
    return std::nullopt;
}

std::string format_time(const TimePoint t) {
    const auto dp = floor<days>(t);
    const year_month_day ymd{dp};
    const hh_mm_ss hms{t - dp};
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02ld:%02ld:%02ld",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<long>(hms.hours().count()),
                  static_cast<long>(hms.minutes().count()),
                  static_cast<long>(hms.seconds().count()));
    return buf;
}

Watermark now_watermark() {
    return time_point_cast<nanoseconds>(system_clock::now());
}

std::optional<Watermark> modification_time(const std::filesystem::path& path) {
    std::error_code ec;
    const auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) return std::nullopt;
    return time_point_cast<nanoseconds>(file_clock::to_sys(ftime));
}

} // namespace datacat
