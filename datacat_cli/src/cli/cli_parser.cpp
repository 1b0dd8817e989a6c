//
// Created by Giuseppe Francione on 12/10/26.
//

#include "cli_parser.hpp"
#include "../../../libdatacat/include/time_utils.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <thread>

namespace {
// accepts the time formats of parse_user_time()
struct TimeValidator : CLI::Validator {
    TimeValidator() {
        name_ = "TIME";
        func_ = [](const std::string& str) {
            if (!datacat::parse_user_time(str)) {
                return std::string("Invalid time: '") + str +
                       "'. Use 'dd.mm.YYYY HH:MM:SS' or 'YYYY-mm-ddTHH:MM:SS'.";
            }
            return std::string(); // ok
        };
    }
};

void add_query_options(CLI::App* sub, Settings& settings) {
    sub->add_option("--mp", settings.mp, "Filter by microphysics scheme id.");
    sub->add_option("--source", settings.source, "Filter by data source (DWD, MODEL).");
    sub->add_option("--radar", settings.radar, "Filter by radar name.");
    sub->add_option("--domain", settings.domain, "Filter by model domain (name or d0N code).");
    sub->add_option("--method", settings.method, "Filter by classification method.");
    sub->add_option("--hm", settings.hm, "Filter by hydrometeor class.");

    sub->add_flag("--load", settings.load,
                  "Load every result with the product loader and report its size.");

    sub->add_option("--report", settings.report_path,
                    "CSV report export filename.")
                    ->take_last();
}
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.set_config("--config", "", "Read options from an INI/TOML configuration file.");
    app.require_subcommand(1);

    // --- Global options ---
    app.add_option("-p,--product", settings.product,
                   "Data product to catalog (see 'datacat products').");

    app.add_option("-r,--root", settings.root,
                   "Root directory holding the product's files.")
                   ->check(CLI::ExistingDirectory);

    app.add_option("--db", settings.db,
                   "Store file (default: datacat_<product>.db in the working directory).");

    app.add_flag("--no-sync", settings.no_sync,
                 "Query the store without synchronizing it first.");

    app.add_flag("--recheck", settings.recheck,
                 "Re-parse indexed files whose modification time changed.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress, summary).");

    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    app.add_option("--threads", settings.num_threads,
                   "Threads used to parse files during a sync.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Subcommands ---
    auto* products = app.add_subcommand("products", "List the built-in products.");
    products->callback([&settings] { settings.command = "products"; });

    auto* sync = app.add_subcommand("sync", "Synchronize the store with the root directory.");
    sync->callback([&settings] { settings.command = "sync"; });

    static const TimeValidator time_validator;

    auto* range = app.add_subcommand("range", "List the records inside a time window.");
    range->add_option("--start", settings.start, "Window start (inclusive).")
         ->required()->check(time_validator);
    range->add_option("--end", settings.end, "Window end (inclusive).")
         ->required()->check(time_validator);
    add_query_options(range, settings);
    range->callback([&settings] { settings.command = "range"; });

    auto* closest = app.add_subcommand("closest", "Show the record closest to a time.");
    closest->add_option("-t,--time", settings.time, "Reference time.")
           ->required()->check(time_validator);
    add_query_options(closest, settings);
    closest->callback([&settings] { settings.command = "closest"; });

    auto* latest = app.add_subcommand("latest", "List the most recent records.");
    latest->add_option("-n,--count", settings.count, "Number of records.")
          ->default_val(1)
          ->check(CLI::PositiveNumber);
    add_query_options(latest, settings);
    latest->callback([&settings] { settings.command = "latest"; });

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        std::transform(settings.log_level.begin(), settings.log_level.end(),
                       settings.log_level.begin(), ::toupper);

        if (settings.command != "products" && settings.product.empty()) {
            throw CLI::ValidationError("Option '-p, --product' is required for '" + settings.command + "'.");
        }

        if (settings.command == "range") {
            if (*datacat::parse_user_time(settings.start) > *datacat::parse_user_time(settings.end)) {
                throw CLI::ValidationError("--start must not be after --end.");
            }
        }
    });
}
