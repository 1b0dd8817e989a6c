//
// Created by Giuseppe Francione on 08/10/26.
//

/**
 * @file dataset_linker.hpp
 * @brief Resolves which DatasetRecord a parsed file belongs to.
 */

#ifndef DATACAT_DATASET_LINKER_HPP
#define DATACAT_DATASET_LINKER_HPP

#include "records.hpp"
#include "sqlite_store.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace datacat {

/**
 * @brief Outcome of DatasetLinker::attach().
 */
struct LinkResult {
    std::int64_t dataset_id = 0;
    bool created = false;   ///< true if a new DatasetRecord was inserted
};

/**
 * @brief Where a file is currently linked.
 */
struct FileLink {
    std::int64_t dataset_id = 0;
    std::string role;
};

/**
 * @brief Enforces the one-record-per-identity invariant.
 *
 * @details All writes go through the caller's open Transaction, so a
 * created or updated DatasetRecord is committed together with the
 * FileRecord that triggered it.
 */
class DatasetLinker {
public:
    explicit DatasetLinker(SqliteStore& store) : store_(store) {}

    /**
     * @brief Attach a file to the DatasetRecord of @p key.
     *
     * - no match: a DatasetRecord is created with @p role populated;
     * - one match: @p role is set or replaced, @p attrs overwrite the stored ones;
     * - more matches: DuplicateDatasetError, nothing is written.
     *
     * @throws DuplicateDatasetError on a consistency fault.
     */
    LinkResult attach(const IdentityKey& key,
                      const std::string& role,
                      const FileRecord& file,
                      const std::map<std::string, std::string>& attrs);

    /// Ids of the DatasetRecords stored under @p key, ascending.
    [[nodiscard]] std::vector<std::int64_t> find(const IdentityKey& key) const;

    /// Current link of a file, std::nullopt if it backs no role.
    [[nodiscard]] std::optional<FileLink> link_of(std::int64_t file_id) const;

    /// Identity key of a stored DatasetRecord.
    [[nodiscard]] std::optional<IdentityKey> identity_of(std::int64_t dataset_id) const;

    /// Clear a role slot. The DatasetRecord itself is kept.
    void detach(const FileLink& link);

private:
    std::int64_t insert_dataset(const IdentityKey& key);

    SqliteStore& store_;
};

} // namespace datacat

#endif // DATACAT_DATASET_LINKER_HPP
