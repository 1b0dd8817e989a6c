//
// Created by Giuseppe Francione on 06/10/26.
//

#ifndef DATACAT_EVENTS_HPP
#define DATACAT_EVENTS_HPP

#include "records.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace datacat {

/**
 * @brief Events published during a synchronization pass.
 *
 * Plain data carriers for EventBus subscribers (observer bridge, tests, CLI).
 * They are published from the thread running Catalog::sync(), never from
 * the parse workers.
 */

// --- Phase 1: Walk ---

/**
 * @brief Emitted when a sync pass begins.
 */
struct SyncStartEvent {
    std::filesystem::path root; ///< Root directory being walked
    bool recheck = false;       ///< True if already indexed files are re-examined
};

/**
 * @brief Emitted when a file is not (re)parsed.
 */
struct FileSkippedEvent {
    std::filesystem::path path; ///< Path of the skipped file
    std::string reason;         ///< Reason for skipping
};

// --- Phase 3: Link ---

/**
 * @brief Emitted when a parsed file has been attached to its DatasetRecord.
 */
struct FileIndexedEvent {
    std::filesystem::path path; ///< Path of the indexed file
    std::string kind;           ///< Stored file kind
    std::string role;           ///< Role slot filled
    std::string identity;       ///< Canonical identity of the DatasetRecord
    bool created = false;       ///< True if the DatasetRecord was created by this file
};

/**
 * @brief Emitted when a file could not be parsed and was recorded as corrupt.
 */
struct FileCorruptEvent {
    std::filesystem::path path; ///< Path of the file
    std::string error_message;  ///< Parser diagnostic
};

// --- End of pass ---

/**
 * @brief Emitted when a sync pass has been committed or cancelled.
 */
struct SyncCompleteEvent {
    SyncSummary summary;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a sync pass aborts and its changes are rolled back.
 */
struct SyncErrorEvent {
    std::filesystem::path path; ///< File being linked when the pass aborted, may be empty
    std::string error_message;
};

} // namespace datacat

#endif // DATACAT_EVENTS_HPP
