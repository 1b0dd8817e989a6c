//
// Created by Giuseppe Francione on 03/10/26.
//

/**
 * @file errors.hpp
 * @brief Exception types thrown by libdatacat.
 *
 * Everything the catalog reports to callers derives from CatalogError,
 * so callers can branch on the concrete type or catch the whole family.
 */

#ifndef DATACAT_ERRORS_HPP
#define DATACAT_ERRORS_HPP

#include "records.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace datacat {

/**
 * @brief Base class of all catalog errors.
 */
class CatalogError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The store could not be created or opened (permissions, not a
 * database, created for another product).
 */
class OpenError : public CatalogError {
public:
    using CatalogError::CatalogError;
};

/**
 * @brief SQLite failure on an already open store.
 */
class StoreError : public CatalogError {
public:
    using CatalogError::CatalogError;
};

/**
 * @brief A parser could not extract the keys of a file.
 *
 * Sync absorbs it and records the file with kind "corrupt".
 */
class ParseError : public CatalogError {
public:
    using CatalogError::CatalogError;
};

/**
 * @brief A query that must return one record found none.
 */
class NotFoundError : public CatalogError {
public:
    using CatalogError::CatalogError;
};

/**
 * @brief ResultHandle::load() failed. The loader's exception is nested.
 */
class LoadError : public CatalogError {
public:
    using CatalogError::CatalogError;
};

/**
 * @brief More than one DatasetRecord matches an identity key.
 *
 * The sync that hit it is rolled back. The error carries the summary
 * counted up to the fault, including the path that triggered it.
 */
class DuplicateDatasetError : public CatalogError {
public:
    DuplicateDatasetError(std::string identity, std::filesystem::path path, size_t matches)
        : CatalogError("consistency fault: " + std::to_string(matches) +
                       " datasets match identity '" + identity + "' (while linking " +
                       path.string() + ")"),
          identity_(std::move(identity)),
          path_(std::move(path)),
          matches_(matches) {}

    [[nodiscard]] const std::string& identity() const noexcept { return identity_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] size_t matches() const noexcept { return matches_; }
    [[nodiscard]] const SyncSummary& summary() const noexcept { return summary_; }

    void set_summary(SyncSummary summary) { summary_ = std::move(summary); }

private:
    std::string identity_;
    std::filesystem::path path_;
    size_t matches_;
    SyncSummary summary_;
};

} // namespace datacat

#endif // DATACAT_ERRORS_HPP
