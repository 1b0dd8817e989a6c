//
// Created by Giuseppe Francione on 09/10/26.
//

#include "../../include/file_scanner.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

std::vector<fs::path> datacat::collect_files(const fs::path& root, const std::function<bool()>& should_stop) {
    std::vector<fs::path> result;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        Logger::log(LogLevel::Warning, "Root directory not found: " + root.string(), "scanner");
        return result;
    }

    const auto options = fs::directory_options::skip_permission_denied;
    fs::recursive_directory_iterator it(root, options, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (should_stop && should_stop()) {
            Logger::log(LogLevel::Debug, "Directory walk interrupted below " + root.string(), "scanner");
            break;
        }
        std::error_code ec2;
        if (it->is_regular_file(ec2)) {
            result.push_back(it->path());
        }
    }
    if (ec) {
        Logger::log(LogLevel::Warning,
                    "Directory walk stopped early below " + root.string() + ": " + ec.message(),
                    "scanner");
    }

    // directory iteration order is unspecified, sync needs path order
    std::sort(result.begin(), result.end());

    Logger::log(LogLevel::Debug,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
