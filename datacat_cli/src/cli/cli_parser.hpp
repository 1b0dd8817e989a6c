//
// Created by Giuseppe Francione on 12/10/26.
//

#ifndef DATACAT_CLI_PARSER_HPP
#define DATACAT_CLI_PARSER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::string command;              ///< name of the parsed subcommand

    // --- global ---
    std::string product;
    std::filesystem::path root = ".";
    std::filesystem::path db;
    bool no_sync = false;
    bool recheck = false;
    bool quiet = false;
    unsigned num_threads = 1;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;

    // --- queries ---
    std::string start;
    std::string end;
    std::string time;
    size_t count = 1;
    bool load = false;
    std::filesystem::path report_path;

    std::optional<std::int64_t> mp;
    std::optional<std::string> source;
    std::optional<std::string> radar;
    std::optional<std::string> domain;
    std::optional<std::string> method;
    std::optional<std::string> hm;

    /// Store path, defaulting to "datacat_<product>.db" in the working directory.
    [[nodiscard]] std::filesystem::path store_path() const {
        return db.empty() ? std::filesystem::path("datacat_" + product + ".db") : db;
    }

    [[nodiscard]] bool is_query() const {
        return command == "range" || command == "closest" || command == "latest";
    }
};

/**
 * @brief Configures the CLI11 parser with all subcommands, options and flags.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //DATACAT_CLI_PARSER_HPP
