//
// Created by Giuseppe Francione on 05/10/26.
//

/**
 * @file layout_parser.hpp
 * @brief Parser that derives identity keys from file names and directory layout.
 */

#ifndef DATACAT_LAYOUT_PARSER_HPP
#define DATACAT_LAYOUT_PARSER_HPP

#include "parser.hpp"
#include "records.hpp"
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace datacat {

/**
 * @brief IParser for products laid out as
 * <tt>MP&lt;id&gt;/&lt;radar&gt;/&lt;hydrometeor&gt;/YYYY/mm/dd/&lt;name&gt;</tt>.
 *
 * @details The time comes from the first capture group of @c time_pattern
 * searched in the file name. Descriptive fields are resolved from the
 * directory components below the catalog root:
 * - @c MpId from a component "MP<id>" whose id is a known scheme;
 * - @c Domain from the first capture group of @c domain_pattern (a domain
 *   code such as "d03") or from a component equal to a domain label;
 * - every other field from a component equal to a code or label of its
 *   reference category.
 *
 * Missing required fields, empty files and unreadable files raise ParseError.
 */
class LayoutParser final : public IParser {
public:
    struct Options {
        std::string name;
        std::string time_pattern;                 ///< regex, group 1 = time text
        std::string time_format;                  ///< parse_time() format of group 1
        std::string domain_pattern;               ///< optional regex, group 1 = domain code
        std::vector<Field> required;              ///< fields that must resolve
        std::vector<Field> optional;              ///< fields resolved when present
        std::map<Field, std::string> constants;   ///< fixed values, e.g. radar of a site archive
        std::vector<ReferenceValue> reference;    ///< legal values per category
    };

    /**
     * @throws std::regex_error if a pattern does not compile.
     */
    explicit LayoutParser(Options options);

    [[nodiscard]] std::string_view get_name() const noexcept override { return options_.name; }

    [[nodiscard]] ParsedFile parse(const ParseRequest& request) const override;

private:
    [[nodiscard]] std::optional<std::string> resolve(Field field,
                                                     const std::vector<std::string>& dirs,
                                                     const std::string& filename) const;

    /// Label for a code or label of a category, std::nullopt if unknown.
    [[nodiscard]] std::optional<std::string> lookup(std::string_view category,
                                                    std::string_view value) const;

    Options options_;
    std::regex time_re_;
    std::optional<std::regex> domain_re_;
};

} // namespace datacat

#endif // DATACAT_LAYOUT_PARSER_HPP
