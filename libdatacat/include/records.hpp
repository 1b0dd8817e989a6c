//
// Created by Giuseppe Francione on 03/10/26.
//

/**
 * @file records.hpp
 * @brief Plain data types shared by the store, the linker and the queries.
 */

#ifndef DATACAT_RECORDS_HPP
#define DATACAT_RECORDS_HPP

#include "time_utils.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace datacat {

/**
 * @brief Descriptive attributes a product may use besides time.
 *
 * Every Field is a column of the dataset table, a member of IdentityKey
 * and of QueryFilter.
 */
enum class Field {
    MpId,        ///< WRF microphysics scheme id
    Source,      ///< "DWD" or "MODEL"
    Radar,       ///< radar name, real or simulated
    Domain,      ///< model domain name
    Method,      ///< classification method
    Hydrometeor  ///< simulated hydrometeor class
};

/// Column / attribute name of a field ("mp_id", "source", ...).
std::string_view field_name(Field field) noexcept;

/// Reference data category holding the legal values of a field.
std::string_view field_category(Field field) noexcept;

/// Every Field, in column order.
const std::vector<Field>& all_fields();

/**
 * @brief The attribute tuple identifying one logical observation.
 *
 * Two parsed files with equal keys belong to the same DatasetRecord.
 * Fields a product does not use stay unset.
 */
struct IdentityKey {
    TimePoint time{};
    TimePoint end_time{};
    std::optional<std::int64_t> mp_id;
    std::optional<std::string> source;
    std::optional<std::string> radar;
    std::optional<std::string> domain;
    std::optional<std::string> method;
    std::optional<std::string> hydrometeor;

    /// Value of a descriptive field rendered as text, std::nullopt if unset.
    [[nodiscard]] std::optional<std::string> get(Field field) const;

    /// Set a descriptive field from its text form (mp_id must be numeric).
    void set(Field field, const std::string& value);

    /**
     * @brief Canonical string form, e.g. "time=1559044800;end=1559044800;mp_id=8;domain=Munich".
     *
     * Unset fields are left out, so an unset field and an empty value differ.
     * '\\', ';' and '=' inside values are escaped with a backslash. Two keys
     * render to the same string if and only if they compare equal.
     */
    [[nodiscard]] std::string canonical() const;

    bool operator==(const IdentityKey&) const = default;
};

/// Kind name given to files whose parse failed.
inline constexpr std::string_view kCorruptKind = "corrupt";

/**
 * @brief Index entry for one physical file.
 */
struct FileRecord {
    std::int64_t id = 0;
    std::filesystem::path path;
    std::string kind;
    Watermark last_checked{};

    bool operator==(const FileRecord&) const = default;
};

/**
 * @brief One logical observation, possibly backed by several files.
 */
struct DatasetRecord {
    std::int64_t id = 0;
    IdentityKey key;
    std::map<std::string, FileRecord> roles;         ///< role name -> file
    std::map<std::string, std::string> attributes;   ///< free-form parsed attributes

    bool operator==(const DatasetRecord&) const = default;
};

/**
 * @brief One row of static reference data (e.g. category "mp_scheme", code "8",
 * label "Thompson").
 */
struct ReferenceValue {
    std::string category;
    std::string code;
    std::string label;

    bool operator==(const ReferenceValue&) const = default;
};

/**
 * @brief Equality predicates applied before any temporal operation.
 *
 * Unset members do not filter.
 */
struct QueryFilter {
    std::optional<std::int64_t> mp_id;
    std::optional<std::string> source;
    std::optional<std::string> radar;
    std::optional<std::string> domain;
    std::optional<std::string> method;
    std::optional<std::string> hydrometeor;

    [[nodiscard]] std::optional<std::string> get(Field field) const;
};

/// Value of a handle attribute.
using AttributeValue = std::variant<std::string, std::int64_t, TimePoint>;

/// Attribute map with heterogeneous lookup.
using Attributes = std::map<std::string, AttributeValue, std::less<>>;

/// Render an attribute for display or CSV export.
std::string attribute_to_string(const AttributeValue& value);

/**
 * @brief Counters reported by Catalog::sync().
 */
struct SyncSummary {
    size_t files_scanned = 0;     ///< regular files seen by the walk
    size_t files_accepted = 0;    ///< files parsed and linked (new or modified)
    size_t files_skipped = 0;     ///< unrecognized names and unchanged files
    size_t files_corrupt = 0;     ///< files recorded with kind "corrupt"
    size_t files_parsed = 0;      ///< parser invocations
    size_t datasets_created = 0;
    size_t datasets_updated = 0;
    size_t fatal = 0;             ///< 1 if a consistency fault aborted the sync
    bool cancelled = false;
    std::filesystem::path fault_path; ///< file that triggered the fatal fault
};

} // namespace datacat

#endif // DATACAT_RECORDS_HPP
