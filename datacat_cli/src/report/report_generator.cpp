//
// Created by Giuseppe Francione on 13/10/26.
//

#include "report_generator.hpp"
#include "../utils/color.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <sys/ioctl.h>
#include <unistd.h>

using datacat::Field;

static bool is_stdout_a_tty() {
    return isatty(fileno(stdout)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string attribute_or_dash(const datacat::ResultHandle& h, const std::string_view name) {
    const auto v = h.attribute(name);
    return v ? datacat::attribute_to_string(*v) : "-";
}

static std::string roles_of(const datacat::ResultHandle& h, const bool full_path) {
    std::string out;
    for (const auto& [role, path] : h.files()) {
        if (!out.empty()) out += "; ";
        out += role + "=" + (full_path ? path.string() : path.filename().string());
    }
    return out;
}

void print_console_report(const std::vector<Result>& results,
                          const datacat::ProductSchema& product,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stdout_a_tty();
    const bool any_loaded = std::any_of(results.begin(), results.end(), [](const Result& r) {
        return r.loaded || !r.error_msg.empty();
    });

    constexpr size_t time_width = 21;
    std::vector<size_t> field_widths;
    for (const Field f : product.fields) {
        size_t w = datacat::field_name(f).size() + 2;
        for (const auto& r : results) {
            w = std::max(w, attribute_or_dash(r.handle, datacat::field_name(f)).size() + 2);
        }
        field_widths.push_back(w);
    }
    const size_t load_width = any_loaded ? 14 : 0;

    size_t fixed_cols_width = time_width + load_width;
    for (const auto w : field_widths) fixed_cols_width += w;
    const size_t files_col_width = term_width > fixed_cols_width + 10
                                   ? term_width - fixed_cols_width
                                   : 30;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cout << std::left << std::setw(time_width) << "Time";
    for (size_t i = 0; i < product.fields.size(); ++i) {
        std::cout << std::setw(field_widths[i]) << datacat::field_name(product.fields[i]);
    }
    if (any_loaded) std::cout << std::setw(load_width) << "Loaded(KB)";
    std::cout << "Files\n";

    for (const auto& r : results) {
        std::cout << std::left << std::setw(time_width) << datacat::format_time(r.handle.time());
        for (size_t i = 0; i < product.fields.size(); ++i) {
            std::cout << std::setw(field_widths[i])
                      << attribute_or_dash(r.handle, datacat::field_name(product.fields[i]));
        }
        if (any_loaded) {
            std::string loaded;
            if (r.loaded) {
                loaded = std::to_string(r.bytes / 1024);
            } else {
                loaded = use_colors ? RED "FAIL" RESET : "FAIL";
            }
            // escape codes do not take up columns
            const size_t pad = use_colors && !r.loaded ? load_width + 11 : load_width;
            std::cout << std::setw(pad) << loaded;
        }
        std::cout << truncate(roles_of(r.handle, false), files_col_width) << "\n";
        if (!r.error_msg.empty()) {
            std::cout << "    Error: " << r.error_msg << "\n";
        }
    }

    std::cerr << "\n" << results.size() << " record" << (results.size() == 1 ? "" : "s")
              << " (" << std::fixed << std::setprecision(2) << total_seconds << " s)\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const datacat::ProductSchema& product,
                       const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Time,EndTime";
    for (const Field f : product.fields) {
        out << "," << datacat::field_name(f);
    }
    out << ",Files,Loaded(KB),Error\n";

    for (const auto& r : results) {
        out << csv_escape(datacat::format_time(r.handle.time())) << ","
            << csv_escape(attribute_or_dash(r.handle, "end_time"));
        for (const Field f : product.fields) {
            out << "," << csv_escape(attribute_or_dash(r.handle, datacat::field_name(f)));
        }
        out << "," << csv_escape(roles_of(r.handle, true)) << ","
            << (r.loaded ? std::to_string(r.bytes / 1024) : "") << ","
            << csv_escape(r.error_msg) << "\n";
    }
    return static_cast<bool>(out);
}

void print_sync_summary(const datacat::SyncSummary& summary, const double total_seconds) {
    std::cerr << "\nScanned:  " << summary.files_scanned << " files\n"
              << "Accepted: " << summary.files_accepted << "\n"
              << "Skipped:  " << summary.files_skipped << "\n"
              << "Corrupt:  " << summary.files_corrupt << "\n"
              << "Datasets: " << summary.datasets_created << " created, "
              << summary.datasets_updated << " updated\n";
    if (summary.fatal) {
        std::cerr << RED << "Fatal consistency fault at " << summary.fault_path.string() << RESET << "\n";
    }
    if (summary.cancelled) {
        std::cerr << YELLOW << "Cancelled, no changes were committed." << RESET << "\n";
    }
    std::cerr << "Total time: " << std::fixed << std::setprecision(2) << total_seconds << " s\n";
}

void print_products(const std::vector<datacat::ProductSchema>& products) {
    std::cout << std::left << std::setw(8) << "Product" << std::setw(28) << "Kinds"
              << std::setw(32) << "Filters" << "Description\n";
    for (const auto& p : products) {
        std::string kinds;
        for (const auto& rule : p.kinds.rules()) {
            if (!kinds.empty()) kinds += ", ";
            kinds += rule.kind;
        }
        std::string filters;
        for (const Field f : p.fields) {
            if (!filters.empty()) filters += ", ";
            filters += datacat::field_name(f);
        }
        std::cout << std::setw(8) << p.name << std::setw(28) << kinds
                  << std::setw(32) << filters << p.description << "\n";
    }
}
