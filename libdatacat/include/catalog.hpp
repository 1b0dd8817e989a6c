//
// Created by Giuseppe Francione on 10/10/26.
//

/**
 * @file catalog.hpp
 * @brief Public API of the datacat library.
 */

#ifndef DATACAT_CATALOG_HPP
#define DATACAT_CATALOG_HPP

#include "event_bus.hpp"
#include "product.hpp"
#include "records.hpp"
#include "result_handle.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace datacat {

/**
 * @brief Options of Catalog::open().
 */
struct CatalogConfig {
    /**
     * @brief Run a full sync() before open() returns.
     * Default: true.
     */
    bool sync = true;

    /**
     * @brief Re-examine already indexed files through their modification time.
     * Default: false (indexed files are trusted).
     */
    bool recheck = false;

    /**
     * @brief Number of parse worker threads.
     * Default: 1.
     */
    unsigned threads = 1;
};

/**
 * @brief Interface for receiving sync progress.
 *
 * Callbacks run on the thread calling sync() while it holds the catalog
 * exclusively; apart from stop() they must not call back into the Catalog.
 */
struct CatalogObserver {
    virtual ~CatalogObserver() = default;

    virtual void onSyncStart(const std::filesystem::path& root) {}

    virtual void onFileIndexed(const std::filesystem::path& path,
                               const std::string& role,
                               bool created) {}

    virtual void onFileSkipped(const std::filesystem::path& path,
                               const std::string& reason) {}

    virtual void onFileCorrupt(const std::filesystem::path& path,
                               const std::string& error) {}

    virtual void onSyncFinish(const SyncSummary& summary) {}
};

/**
 * @brief Index of one product's files below one root directory.
 *
 * @details A Catalog exclusively owns its SQLite store. One sync() runs at
 * a time and holds the store exclusively; queries take a shared lock and
 * may run concurrently with each other. Move-only; the store is released
 * by close() or the destructor.
 *
 * Uses PIMPL to keep SQLite and the worker pool out of the public API.
 */
class Catalog {
public:
    /**
     * @brief Open (or create) the store of @p product and bind it to @p root.
     *
     * A new store is seeded with the product's reference data. With
     * @c config.sync the catalog is synchronized before returning.
     *
     * @throws OpenError if the store cannot be created or opened.
     * @throws DuplicateDatasetError if the initial sync hits a consistency fault.
     */
    static Catalog open(const std::filesystem::path& root,
                        const std::filesystem::path& store_path,
                        const ProductSchema& product,
                        CatalogConfig config = {});

    ~Catalog();

    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;
    Catalog(Catalog&&) noexcept;
    Catalog& operator=(Catalog&&) noexcept;

    // --- Indexing ---

    /**
     * @brief Reconcile the store with the files below the root.
     *
     * All changes of one pass are committed together. A cancelled pass
     * rolls back and returns with @c cancelled set.
     *
     * @throws DuplicateDatasetError on a consistency fault (rolled back).
     * @throws StoreError on a SQLite failure (rolled back).
     */
    SyncSummary sync();

    /**
     * @brief Requests cancellation of a running sync().
     *
     * Only stores an atomic flag that sync() polls between files, so it may be
     * called from any thread, an observer callback, or a signal handler.
     */
    void stop() noexcept;

    // --- Queries ---

    /// @throws std::invalid_argument if start > end or a filter value is unknown.
    [[nodiscard]] std::vector<ResultHandle> range(TimePoint start, TimePoint end,
                                                  const QueryFilter& filter = {}) const;

    /// @throws NotFoundError if no record passes the filter.
    [[nodiscard]] ResultHandle closest(TimePoint t, const QueryFilter& filter = {}) const;

    [[nodiscard]] std::vector<ResultHandle> latest(std::size_t n,
                                                   const QueryFilter& filter = {}) const;

    // --- Inspection ---

    [[nodiscard]] std::vector<FileRecord> files() const;
    [[nodiscard]] std::vector<DatasetRecord> datasets() const;
    [[nodiscard]] std::size_t dataset_count() const;
    [[nodiscard]] std::vector<ReferenceValue> reference() const;
    [[nodiscard]] const ProductSchema& product() const;
    [[nodiscard]] const std::filesystem::path& root() const;

    // --- Observability ---

    /**
     * @brief Bus carrying the events of events.hpp, published by sync().
     */
    [[nodiscard]] EventBus& events();

    /**
     * @brief Sets the observer for sync progress.
     * The caller retains ownership of the observer; nullptr detaches it.
     */
    void setObserver(CatalogObserver* observer);

    // --- Lifecycle ---

    /**
     * @brief Release the store. Further calls throw std::logic_error;
     * handles already returned stay usable.
     */
    void close();

    [[nodiscard]] bool is_open() const;

private:
    struct Impl;
    explicit Catalog(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace datacat

#endif // DATACAT_CATALOG_HPP
