//
// Created by Giuseppe Francione on 13/10/26.
//

#ifndef DATACAT_REPORT_GENERATOR_HPP
#define DATACAT_REPORT_GENERATOR_HPP

#include "../../../libdatacat/include/product.hpp"
#include "../../../libdatacat/include/records.hpp"
#include "../../../libdatacat/include/result_handle.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct Result {
    datacat::ResultHandle handle;   // query result snapshot
    bool loaded{};                  // --load was requested and succeeded
    uintmax_t bytes{};              // bytes returned by the loader
    std::string error_msg;          // if loading failed, reason of failure
};

void print_console_report(const std::vector<Result>& results,
                          const datacat::ProductSchema& product,
                          double total_seconds);

/**
 * @return false if the file could not be written.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const datacat::ProductSchema& product,
                       const std::filesystem::path& output_path);

void print_sync_summary(const datacat::SyncSummary& summary, double total_seconds);

void print_products(const std::vector<datacat::ProductSchema>& products);

unsigned get_terminal_width();

#endif //DATACAT_REPORT_GENERATOR_HPP
