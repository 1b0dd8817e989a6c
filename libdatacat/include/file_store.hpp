//
// Created by Giuseppe Francione on 07/10/26.
//

/**
 * @file file_store.hpp
 * @brief Persistent path -> FileRecord map plus catalog metadata and reference data.
 */

#ifndef DATACAT_FILE_STORE_HPP
#define DATACAT_FILE_STORE_HPP

#include "product.hpp"
#include "records.hpp"
#include "sqlite_store.hpp"
#include "time_utils.hpp"
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace datacat {

/**
 * @brief Create the catalog tables if needed and bind the store to a product.
 *
 * A fresh store is seeded with the product's file kinds and reference data.
 * An existing store must have been created for the same product.
 *
 * @throws OpenError on a product mismatch or an unusable database.
 */
void initialize_store(SqliteStore& store, const ProductSchema& product);

class FileStore {
public:
    explicit FileStore(SqliteStore& store) : store_(store) {}

    [[nodiscard]] std::optional<FileRecord> find(const std::filesystem::path& path) const;

    /// Every record keyed by path string, for one-shot lookups during a sync pass.
    [[nodiscard]] std::map<std::string, FileRecord> snapshot() const;

    /// Every record ordered by path.
    [[nodiscard]] std::vector<FileRecord> all() const;

    /**
     * @brief Insert a record or update kind and watermark of an existing one.
     * @throws StoreError if @p kind is not a kind of the product.
     */
    FileRecord upsert(const std::filesystem::path& path, std::string_view kind, Watermark last_checked);

    [[nodiscard]] std::vector<ReferenceValue> reference() const;

    /// Label of a code or label, std::nullopt if unknown.
    [[nodiscard]] std::optional<std::string> reference_label(std::string_view category,
                                                             std::string_view value) const;

private:
    [[nodiscard]] std::int64_t kind_id(std::string_view kind) const;

    SqliteStore& store_;
};

} // namespace datacat

#endif // DATACAT_FILE_STORE_HPP
