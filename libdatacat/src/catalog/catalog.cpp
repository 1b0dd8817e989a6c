//
// Created by Giuseppe Francione on 10/10/26.
//

/**
 * @file catalog.cpp
 * @brief Implementation of the public Catalog API.
 */

#include "../../include/catalog.hpp"

#include "../../include/dataset_linker.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_scanner.hpp"
#include "../../include/file_store.hpp"
#include "../../include/logger.hpp"
#include "../../include/query_engine.hpp"
#include "../../include/sqlite_store.hpp"
#include "../../include/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <shared_mutex>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace datacat {

namespace {

/// A file that passed classification and must be parsed.
struct Candidate {
    fs::path path;
    const KindRule* rule = nullptr;
    std::optional<FileRecord> existing;  ///< set when a modified file is re-parsed
};

/// Result of one parse task.
struct ParseOutcome {
    std::optional<ParsedFile> parsed;
    std::string error;
    Watermark checked_at{};
    bool cancelled = false;
};

static_assert(std::atomic<bool>::is_always_lock_free, "stop() must be async-signal-safe");

} // namespace

struct Catalog::Impl {
    fs::path root;
    ProductSchema product;
    CatalogConfig config;

    SqliteStore store;
    FileStore files;
    DatasetLinker linker;
    QueryEngine queries;
    EventBus eventBus;

    mutable std::shared_mutex mutex;   ///< exclusive for sync/close, shared for reads
    std::atomic<bool> stopRequested{false};   ///< only flag stop() touches, polled by sync()
    std::atomic<CatalogObserver*> observer{nullptr};

    Impl(fs::path root_, const fs::path& store_path, ProductSchema product_, const CatalogConfig config_)
        : root(std::move(root_)),
          product(std::move(product_)),
          config(config_),
          store(store_path),
          files(store),
          linker(store),
          queries(store, product) {
        initialize_store(store, product);
        setupEventBridging();
    }

    void setupEventBridging() {
        eventBus.subscribe<SyncStartEvent>([this](const SyncStartEvent& e) {
            if (auto* o = observer.load()) o->onSyncStart(e.root);
        });

        eventBus.subscribe<FileIndexedEvent>([this](const FileIndexedEvent& e) {
            if (auto* o = observer.load()) o->onFileIndexed(e.path, e.role, e.created);
        });

        eventBus.subscribe<FileSkippedEvent>([this](const FileSkippedEvent& e) {
            if (auto* o = observer.load()) o->onFileSkipped(e.path, e.reason);
        });

        eventBus.subscribe<FileCorruptEvent>([this](const FileCorruptEvent& e) {
            if (auto* o = observer.load()) o->onFileCorrupt(e.path, e.error_message);
        });

        eventBus.subscribe<SyncCompleteEvent>([this](const SyncCompleteEvent& e) {
            if (auto* o = observer.load()) o->onSyncFinish(e.summary);
        });
    }

    void ensureOpen() const {
        if (!store.is_open()) throw std::logic_error("catalog is closed");
    }

    std::vector<ResultHandle> toHandles(const std::vector<DatasetRecord>& records) const {
        std::vector<ResultHandle> handles;
        handles.reserve(records.size());
        for (const auto& rec : records) {
            handles.push_back(ResultHandle::from_record(rec, product.loader));
        }
        return handles;
    }

    void skip(SyncSummary& summary, const fs::path& path, const std::string& reason,
              const LogLevel level = LogLevel::Debug) {
        ++summary.files_skipped;
        Logger::log(level, "Skipping " + path.string() + ": " + reason, "catalog");
        eventBus.publish(FileSkippedEvent{path, reason});
    }

    void link(const Candidate& c, const ParseOutcome& out, SyncSummary& summary) {
        if (!out.parsed) {
            const FileRecord rec = files.upsert(c.path, kCorruptKind, out.checked_at);
            // a modified file that no longer parses stops backing its dataset
            if (c.existing) {
                if (const auto l = linker.link_of(rec.id)) linker.detach(*l);
            }
            ++summary.files_corrupt;
            Logger::log(LogLevel::Warning, "Corrupt file " + c.path.string() + ": " + out.error, "catalog");
            eventBus.publish(FileCorruptEvent{c.path, out.error});
            return;
        }

        const ParsedFile& parsed = *out.parsed;
        const std::string role = parsed.role.empty() ? c.rule->role : parsed.role;
        const FileRecord rec = files.upsert(c.path, c.rule->kind, out.checked_at);

        if (c.existing) {
            if (const auto l = linker.link_of(rec.id)) {
                const auto previous = linker.identity_of(l->dataset_id);
                if (!previous || *previous != parsed.key || l->role != role) {
                    Logger::log(LogLevel::Info, "Relinking " + c.path.string() + " to " + parsed.key.canonical(),
                                "catalog");
                    linker.detach(*l);
                }
            }
        }

        const auto result = linker.attach(parsed.key, role, rec, parsed.attributes);
        ++summary.files_accepted;
        if (result.created) {
            ++summary.datasets_created;
        } else {
            ++summary.datasets_updated;
        }
        eventBus.publish(FileIndexedEvent{c.path, rec.kind, role, parsed.key.canonical(), result.created});
    }

    SyncSummary sync();
};

SyncSummary Catalog::Impl::sync() {
    std::unique_lock lock(mutex);
    ensureOpen();
    stopRequested = false;

    const auto started = std::chrono::steady_clock::now();
    SyncSummary summary;
    Logger::log(LogLevel::Info, "Sync of " + root.string() + " (" + product.name + ") started", "catalog");
    eventBus.publish(SyncStartEvent{root, config.recheck});

    const auto paths = collect_files(root, [this] { return stopRequested.load(); });
    // outlives the pool: running parse tasks reference candidates
    std::vector<Candidate> candidates;

    Transaction tx(store);
    ThreadPool pool(config.threads);

    const auto finish = [&] {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        eventBus.publish(SyncCompleteEvent{summary, elapsed});
        return summary;
    };

    const auto cancel = [&] {
        pool.request_stop();
        tx.rollback();
        summary.cancelled = true;
        Logger::log(LogLevel::Warning, "Sync cancelled, changes rolled back", "catalog");
        return finish();
    };

    if (stopRequested) return cancel();

    // --- Phase 1: walk and decide ---
    const auto known = files.snapshot();
    for (const auto& path : paths) {
        if (stopRequested) return cancel();
        ++summary.files_scanned;

        const auto match = product.kinds.classify(path);
        if (match.status != Classification::Accepted) {
            skip(summary, path, match.reason,
                 match.status == Classification::Unrecognized ? LogLevel::Debug : LogLevel::Warning);
            continue;
        }

        const auto it = known.find(path.string());
        if (it == known.end()) {
            candidates.push_back({path, match.rule, std::nullopt});
            continue;
        }
        if (!config.recheck) {
            skip(summary, path, "already indexed");
            continue;
        }
        const auto mtime = modification_time(path);
        if (!mtime || *mtime <= it->second.last_checked) {
            skip(summary, path, "unchanged since last check");
            continue;
        }
        candidates.push_back({path, match.rule, it->second});
    }

    // --- Phase 2: parse ---
    const IParser& parser = *product.parser;
    std::vector<std::future<ParseOutcome>> futures;
    futures.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (stopRequested) return cancel();
        futures.push_back(pool.enqueue([this, &c, &parser](const std::stop_token& st) {
            ParseOutcome out;
            out.checked_at = now_watermark();
            if (st.stop_requested() || stopRequested) {
                out.cancelled = true;
                return out;
            }
            try {
                out.parsed = parser.parse(ParseRequest{c.path, c.path.lexically_relative(root), *c.rule});
            } catch (const std::exception& e) {
                out.error = e.what();
            }
            return out;
        }));
    }

    // --- Phase 3: link in path order ---
    fs::path current;
    try {
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (stopRequested) return cancel();
            current = candidates[i].path;

            ParseOutcome out;
            try {
                out = futures[i].get();
            } catch (const std::future_error&) {
                // task discarded by request_stop()
                return cancel();
            }
            if (out.cancelled) return cancel();

            ++summary.files_parsed;
            link(candidates[i], out, summary);
        }
        if (stopRequested) return cancel();
        tx.commit();
    } catch (DuplicateDatasetError& e) {
        pool.request_stop();
        summary.fatal = 1;
        summary.fault_path = e.path();
        e.set_summary(summary);
        Logger::log(LogLevel::Error, std::string("Sync aborted, changes rolled back: ") + e.what(), "catalog");
        eventBus.publish(SyncErrorEvent{e.path(), e.what()});
        throw;
    } catch (const std::exception& e) {
        pool.request_stop();
        Logger::log(LogLevel::Error, std::string("Sync aborted, changes rolled back: ") + e.what(), "catalog");
        eventBus.publish(SyncErrorEvent{current, e.what()});
        throw;
    }

    Logger::log(LogLevel::Info,
                "Sync finished: " + std::to_string(summary.files_scanned) + " scanned, " +
                std::to_string(summary.files_accepted) + " accepted, " +
                std::to_string(summary.files_skipped) + " skipped, " +
                std::to_string(summary.files_corrupt) + " corrupt",
                "catalog");
    return finish();
}

// --- Catalog ---

Catalog::Catalog(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

Catalog Catalog::open(const fs::path& root,
                      const fs::path& store_path,
                      const ProductSchema& product,
                      const CatalogConfig config) {
    if (!product.parser) {
        throw std::invalid_argument("product '" + product.name + "' has no parser");
    }

    std::error_code ec;
    fs::path abs_root = fs::absolute(root, ec);
    if (ec) abs_root = root;
    abs_root = abs_root.lexically_normal();

    if (store_path.has_parent_path()) {
        fs::create_directories(store_path.parent_path(), ec);
        if (ec) {
            throw OpenError("cannot create store directory " + store_path.parent_path().string() + ": " +
                            ec.message());
        }
    }

    Catalog catalog(std::make_unique<Impl>(std::move(abs_root), store_path, product, config));
    if (config.sync) {
        catalog.sync();
    }
    return catalog;
}

Catalog::~Catalog() {
    if (impl_) stop();
}

Catalog::Catalog(Catalog&&) noexcept = default;
Catalog& Catalog::operator=(Catalog&&) noexcept = default;

SyncSummary Catalog::sync() {
    if (!impl_) throw std::logic_error("catalog was moved from");
    return impl_->sync();
}

void Catalog::stop() noexcept {
    if (impl_) impl_->stopRequested.store(true);
}

std::vector<ResultHandle> Catalog::range(const TimePoint start, const TimePoint end,
                                         const QueryFilter& filter) const {
    if (!impl_) throw std::logic_error("catalog was moved from");
    std::shared_lock lock(impl_->mutex);
    impl_->ensureOpen();
    return impl_->toHandles(impl_->queries.range(start, end, filter));
}

ResultHandle Catalog::closest(const TimePoint t, const QueryFilter& filter) const {
    if (!impl_) throw std::logic_error("catalog was moved from");
    std::shared_lock lock(impl_->mutex);
    impl_->ensureOpen();
    return ResultHandle::from_record(impl_->queries.closest(t, filter), impl_->product.loader);
}

std::vector<ResultHandle> Catalog::latest(const std::size_t n, const QueryFilter& filter) const {
    if (!impl_) throw std::logic_error("catalog was moved from");
    std::shared_lock lock(impl_->mutex);
    impl_->ensureOpen();
    return impl_->toHandles(impl_->queries.latest(n, filter));
}

std::vector<FileRecord> Catalog::files() const {
    if (!impl_) throw std::logic_error("catalog was moved from");
    std::shared_lock lock(impl_->mutex);
    impl_->ensureOpen();
    return impl_->files.all();
}

std::vector<DatasetRecord> Catalog::datasets() const {
    if (!impl_) throw std::logic_error("catalog was moved from");
    std::shared_lock lock(impl_->mutex);
    impl_->ensureOpen();
    return impl_->queries.all();
}

std::size_t Catalog::dataset_count() const {
    if (!impl_) throw std::logic_error("catalog was moved from");
    std::shared_lock lock(impl_->mutex);
    impl_->ensureOpen();
    return impl_->queries.count();
}

std::vector<ReferenceValue> Catalog::reference() const {
    if (!impl_) throw std::logic_error("catalog was moved from");
    std::shared_lock lock(impl_->mutex);
    impl_->ensureOpen();
    return impl_->files.reference();
}

const ProductSchema& Catalog::product() const {
    if (!impl_) throw std::logic_error("catalog was moved from");
    return impl_->product;
}

const fs::path& Catalog::root() const {
    if (!impl_) throw std::logic_error("catalog was moved from");
    return impl_->root;
}

EventBus& Catalog::events() {
    if (!impl_) throw std::logic_error("catalog was moved from");
    return impl_->eventBus;
}

void Catalog::setObserver(CatalogObserver* observer) {
    if (!impl_) throw std::logic_error("catalog was moved from");
    impl_->observer.store(observer);
}

void Catalog::close() {
    if (!impl_) return;
    std::unique_lock lock(impl_->mutex);
    impl_->store.close();
    Logger::log(LogLevel::Debug, "Catalog " + impl_->root.string() + " closed", "catalog");
}

bool Catalog::is_open() const {
    return impl_ && impl_->store.is_open();
}

} // namespace datacat
