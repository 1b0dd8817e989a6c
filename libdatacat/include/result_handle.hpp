//
// Created by Giuseppe Francione on 09/10/26.
//

/**
 * @file result_handle.hpp
 * @brief Lazy, attribute-bearing reference to a dataset returned by queries.
 */

#ifndef DATACAT_RESULT_HANDLE_HPP
#define DATACAT_RESULT_HANDLE_HPP

#include "loader.hpp"
#include "records.hpp"
#include <filesystem>
#include <optional>
#include <string_view>

namespace datacat {

/**
 * @brief Immutable snapshot of one DatasetRecord plus its product's Loader.
 *
 * @details A handle holds no reference to the catalog; it stays valid after
 * Catalog::close(). Attributes are the values captured at query time.
 * The loader only runs when load() is called, and nothing checks that the
 * files still match what the catalog indexed.
 */
class ResultHandle {
public:
    ResultHandle(Attributes attributes, FileMap files, Loader loader);

    /// Build the snapshot of a stored record.
    static ResultHandle from_record(const DatasetRecord& record, Loader loader);

    /**
     * @brief Attribute captured at query time.
     * @return std::nullopt if the record has no such attribute.
     */
    [[nodiscard]] std::optional<AttributeValue> attribute(std::string_view name) const;

    [[nodiscard]] const Attributes& attributes() const noexcept { return attributes_; }

    /// role -> path
    [[nodiscard]] const FileMap& files() const noexcept { return files_; }

    /// Path of a role, std::nullopt if the role is not populated.
    [[nodiscard]] std::optional<std::filesystem::path> file(std::string_view role) const;

    /// Primary time attribute.
    [[nodiscard]] TimePoint time() const;

    /**
     * @brief Invoke the loader with the resolved files.
     *
     * The returned Dataset carries a copy of the handle's attributes.
     *
     * @throws LoadError wrapping the loader's exception (std::throw_with_nested),
     * or if the handle has no loader.
     */
    [[nodiscard]] Dataset load() const;

private:
    Attributes attributes_;
    FileMap files_;
    Loader loader_;
};

} // namespace datacat

#endif // DATACAT_RESULT_HANDLE_HPP
