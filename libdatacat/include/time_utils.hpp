//
// Created by Giuseppe Francione on 03/10/26.
//

/**
 * @file time_utils.hpp
 * @brief UTC time point type and the parsing/formatting helpers used by
 * parsers, the store and the CLI.
 */

#ifndef DATACAT_TIME_UTILS_HPP
#define DATACAT_TIME_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace datacat {

/// All catalog times are UTC with one-second resolution.
using TimePoint = std::chrono::sys_seconds;

/// Nanosecond UTC stamp, used for file watermarks.
using Watermark = std::chrono::sys_time<std::chrono::nanoseconds>;

/**
 * @brief Parse a UTC time with a strftime-style format (e.g. "%Y-%m-%d_%H%M%S").
 * @return std::nullopt if the text does not match the format exactly.
 */
std::optional<TimePoint> parse_time(std::string_view text, const std::string& format);

/**
 * @brief Parse a user supplied time.
 *
 * Accepts "dd.mm.YYYY HH:MM:SS", "YYYY-mm-ddTHH:MM:SS" and "YYYY-mm-dd HH:MM:SS".
 */
std::optional<TimePoint> parse_user_time(std::string_view text);

/// Format as "YYYY-mm-dd HH:MM:SS".
std::string format_time(TimePoint t);

/// Seconds since the Unix epoch.
inline std::int64_t to_unix(const TimePoint t) noexcept {
    return t.time_since_epoch().count();
}

inline TimePoint from_unix(const std::int64_t seconds) noexcept {
    return TimePoint{std::chrono::seconds{seconds}};
}

inline std::int64_t to_unix_nanos(const Watermark w) noexcept {
    return w.time_since_epoch().count();
}

inline Watermark from_unix_nanos(const std::int64_t nanos) noexcept {
    return Watermark{std::chrono::nanoseconds{nanos}};
}

/// Current wall clock as a watermark.
Watermark now_watermark();

/**
 * @brief Modification time of a file on the system clock.
 * @return std::nullopt if the file cannot be stat'ed.
 */
std::optional<Watermark> modification_time(const std::filesystem::path& path);

} // namespace datacat

#endif // DATACAT_TIME_UTILS_HPP
