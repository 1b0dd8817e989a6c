//
// Created by Giuseppe Francione on 09/10/26.
//

#ifndef DATACAT_FILE_SCANNER_HPP
#define DATACAT_FILE_SCANNER_HPP

#include <filesystem>
#include <functional>
#include <vector>

namespace datacat {

/**
 * @brief Recursively collect the regular files below @p root, sorted by path.
 *
 * Unreadable directories are logged and skipped. A missing root yields an
 * empty list. @p should_stop is polled once per directory entry; when it
 * returns true the walk ends and the files collected so far are returned.
 */
std::vector<std::filesystem::path> collect_files(const std::filesystem::path& root,
                                                 const std::function<bool()>& should_stop = {});

} // namespace datacat

#endif // DATACAT_FILE_SCANNER_HPP
