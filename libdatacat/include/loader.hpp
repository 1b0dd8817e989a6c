//
// Created by Giuseppe Francione on 05/10/26.
//

/**
 * @file loader.hpp
 * @brief Loader contract and the materialized Dataset returned by ResultHandle::load().
 */

#ifndef DATACAT_LOADER_HPP
#define DATACAT_LOADER_HPP

#include "records.hpp"
#include <any>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace datacat {

/// role -> resolved file path
using FileMap = std::map<std::string, std::filesystem::path>;

/**
 * @brief Materializes the scientific data behind a set of files.
 *
 * The catalog never calls a loader itself; it hands it to ResultHandle.
 * Any exception it throws surfaces as LoadError.
 */
using Loader = std::function<std::any(const FileMap&)>;

/**
 * @brief A loaded dataset: the loader's payload plus the handle's snapshot.
 */
struct Dataset {
    Attributes attributes;
    FileMap files;
    std::any data;   ///< whatever the loader returned
};

/**
 * @brief Payload of the built-in loader: the raw bytes of every role.
 */
struct RawFiles {
    std::map<std::string, std::vector<char>> contents;

    [[nodiscard]] size_t total_bytes() const;
};

/**
 * @brief Read every file of the map into memory.
 * @throws std::runtime_error if a file is missing or unreadable.
 */
RawFiles load_raw_files(const FileMap& files);

/// Loader wrapping load_raw_files().
Loader raw_file_loader();

} // namespace datacat

#endif // DATACAT_LOADER_HPP
