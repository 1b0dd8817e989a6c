//
// Created by Giuseppe Francione on 11/10/26.
//

#include <any>
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <filesystem>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libdatacat/include/catalog.hpp"
#include "../../libdatacat/include/errors.hpp"
#include "../../libdatacat/include/events.hpp"
#include "../../libdatacat/include/logger.hpp"
#include "../../libdatacat/include/product_registry.hpp"

using namespace datacat;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static std::atomic<Catalog*> g_catalog{nullptr};

// handle ctrl+c or termination signals; only lock-free atomics are touched here
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
        if (Catalog* c = g_catalog.load()) {
            c->stop();
        }
    }
}

// flatten a LoadError and the exceptions nested into it
static std::string describe(const std::exception& e) {
    std::string msg = e.what();
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        msg += ": " + describe(inner);
    }
    return msg;
}

static QueryFilter make_filter(const Settings& settings) {
    QueryFilter filter;
    filter.mp_id = settings.mp;
    filter.source = settings.source;
    filter.radar = settings.radar;
    filter.domain = settings.domain;
    filter.method = settings.method;
    filter.hydrometeor = settings.hm;
    return filter;
}

static void subscribe_progress(Catalog& catalog, const Settings& settings) {
    if (settings.quiet) return;
    catalog.events().subscribe<FileIndexedEvent>([](const FileIndexedEvent& e) {
        std::cerr << (e.created ? GREEN "[NEW] " : "[UPD] ") << e.path.filename().string()
                  << " -> " << e.role << RESET << std::endl;
    });
    catalog.events().subscribe<FileCorruptEvent>([](const FileCorruptEvent& e) {
        std::cerr << YELLOW << "[CORRUPT] " << e.path.filename().string()
                  << " (" << e.error_message << ")" << RESET << std::endl;
    });
}

static int run_query(const Catalog& catalog, const Settings& settings) {
    const auto filter = make_filter(settings);
    const auto start = std::chrono::steady_clock::now();

    std::vector<ResultHandle> handles;
    if (settings.command == "range") {
        handles = catalog.range(*parse_user_time(settings.start), *parse_user_time(settings.end), filter);
    } else if (settings.command == "closest") {
        try {
            handles.push_back(catalog.closest(*parse_user_time(settings.time), filter));
        } catch (const NotFoundError& e) {
            Logger::log(LogLevel::Error, e.what(), "main");
            return 1;
        }
    } else {
        handles = catalog.latest(settings.count, filter);
    }

    if (handles.empty()) {
        Logger::log(LogLevel::Error, "No data found for the requested query.", "main");
        return 1;
    }

    std::vector<Result> results;
    results.reserve(handles.size());
    for (auto& h : handles) {
        Result r{std::move(h)};
        if (settings.load) {
            try {
                const Dataset ds = r.handle.load();
                if (const auto* raw = std::any_cast<RawFiles>(&ds.data)) {
                    r.bytes = raw->total_bytes();
                }
                r.loaded = true;
            } catch (const LoadError& e) {
                r.error_msg = describe(e);
                Logger::log(LogLevel::Warning, r.error_msg, "main");
            }
        }
        results.push_back(std::move(r));
    }

    const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (!settings.quiet) {
        print_console_report(results, catalog.product(), seconds);
    }

    if (!settings.report_path.empty()) {
        if (!export_csv_report(results, catalog.product(), settings.report_path)) {
            Logger::log(LogLevel::Error, "Cannot write report " + settings.report_path.string(), "main");
            return 2;
        }
    }
    return 0;
}

int main(int argc, char* argv[]) {

    CLI::App app{"datacat: time-indexed catalog of scientific data files."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
            return 2;
        }
        Logger::add_sink(std::move(fileSink));
    }

    {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = settings.quiet ? LogLevel::Error : Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    const ProductRegistry registry;
    if (settings.command == "products") {
        print_products(registry.all());
        return 0;
    }

    const ProductSchema* product = registry.find(settings.product);
    if (!product) {
        Logger::log(LogLevel::Error, "Unknown product '" + settings.product + "'", "main");
        return 2;
    }

    try {
        CatalogConfig config;
        config.sync = false;
        config.recheck = settings.recheck;
        config.threads = settings.num_threads;

        Catalog catalog = Catalog::open(settings.root, settings.store_path(), *product, config);
        g_catalog = &catalog;
        // cleared before the catalog is destroyed
        struct CatalogSlot {
            ~CatalogSlot() { g_catalog = nullptr; }
        } slot;
        subscribe_progress(catalog, settings);

        if (settings.command == "sync" || !settings.no_sync) {
            const auto start = std::chrono::steady_clock::now();
            const SyncSummary summary = catalog.sync();
            const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
            if (!settings.quiet) {
                print_sync_summary(summary, seconds);
            }
            if (summary.cancelled || interrupted.load()) {
                std::cerr << CYAN << "[INTERRUPT] Stop detected. The sync was rolled back." << RESET << std::endl;
                return 130; // standard exit code for SIGINT
            }
        }

        int rc = 0;
        if (settings.is_query()) {
            rc = run_query(catalog, settings);
        }
        catalog.close();
        return rc;
    } catch (const DuplicateDatasetError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        print_sync_summary(e.summary(), 0.0);
        return 2;
    } catch (const CatalogError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return 2;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Error: ") + e.what(), "main");
        return 2;
    }
}
