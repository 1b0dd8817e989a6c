//
// Created by Giuseppe Francione on 04/10/26.
//

/**
 * @file file_kind.hpp
 * @brief Static, per-product table mapping file names to file kinds and roles.
 */

#ifndef DATACAT_FILE_KIND_HPP
#define DATACAT_FILE_KIND_HPP

#include <filesystem>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace datacat {

/**
 * @brief One accepted file kind of a product.
 *
 * A file belongs to the kind when its name starts with @c prefix and ends
 * with @c suffix (empty strings match anything). If @c name_pattern is set,
 * the whole file name must also match it, otherwise the name is malformed.
 */
struct KindRule {
    std::string kind;          ///< stored kind name, e.g. "wrfout"
    std::string role;          ///< role slot in the DatasetRecord, e.g. "wrfout"
    std::string prefix;
    std::string suffix;
    std::string name_pattern;  ///< ECMAScript regex for the full file name
};

enum class Classification {
    Accepted,      ///< matched a rule
    Unrecognized,  ///< no rule applies (or junk file)
    Malformed,     ///< a rule applies but the name does not follow its pattern
    Excluded       ///< explicitly excluded by the product
};

/**
 * @brief Outcome of classifying one path.
 */
struct KindMatch {
    Classification status = Classification::Unrecognized;
    const KindRule* rule = nullptr;     ///< set when status is Accepted or Malformed
    std::string reason;                    ///< diagnostic for anything but Accepted
};

/**
 * @brief Ordered list of KindRule; the first matching rule wins.
 */
class KindTable {
public:
    KindTable() = default;

    /**
     * @param rules Rules in priority order.
     * @param excluded_suffixes File name endings always skipped (known-bad files).
     * @throws std::regex_error if a name pattern does not compile.
     */
    explicit KindTable(std::vector<KindRule> rules,
                       std::vector<std::string> excluded_suffixes = {});

    /**
     * @brief Classify a file by its name only.
     */
    [[nodiscard]] KindMatch classify(const std::filesystem::path& path) const;

    [[nodiscard]] const std::vector<KindRule>& rules() const { return rules_; }

private:
    std::vector<KindRule> rules_;
    std::vector<std::regex> patterns_;  ///< parallel to rules_, default-constructed when unused
    std::vector<std::string> excluded_suffixes_;
};

/// Operating system leftovers (".DS_Store", "._*", "desktop.ini").
bool is_junk_file(const std::filesystem::path& path);

} // namespace datacat

#endif // DATACAT_FILE_KIND_HPP
