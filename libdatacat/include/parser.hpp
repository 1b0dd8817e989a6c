//
// Created by Giuseppe Francione on 04/10/26.
//

/**
 * @file parser.hpp
 * @brief Parser adapter contract: file path + kind -> identity key, role, attributes.
 */

#ifndef DATACAT_PARSER_HPP
#define DATACAT_PARSER_HPP

#include "file_kind.hpp"
#include "records.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace datacat {

/**
 * @brief Input of one parse call.
 */
struct ParseRequest {
    std::filesystem::path path;      ///< absolute path of the file
    std::filesystem::path relative;  ///< path relative to the catalog root
    const KindRule& kind;            ///< kind the file was classified as
};

/**
 * @brief Keys extracted from one file.
 */
struct ParsedFile {
    std::string role;
    IdentityKey key;
    std::map<std::string, std::string> attributes; ///< free-form descriptive values
};

/**
 * @brief Interface of a parser adapter.
 *
 * Parsers are called concurrently from the sync worker pool, so parse()
 * must be thread-safe and must not keep per-file state.
 */
class IParser {
public:
    virtual ~IParser() = default;

    /// @return Human-readable name of the parser.
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @brief Extract the keys of a file.
     * @throws ParseError (or any std::exception) if the file cannot be parsed.
     */
    [[nodiscard]] virtual ParsedFile parse(const ParseRequest& request) const = 0;
};

/**
 * @brief Adapts a plain callable to IParser.
 */
class FunctionParser final : public IParser {
public:
    using Function = std::function<ParsedFile(const ParseRequest&)>;

    FunctionParser(std::string name, Function fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return name_; }

    [[nodiscard]] ParsedFile parse(const ParseRequest& request) const override {
        return fn_(request);
    }

private:
    std::string name_;
    Function fn_;
};

} // namespace datacat

#endif // DATACAT_PARSER_HPP
