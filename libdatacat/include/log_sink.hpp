//
// Created by Giuseppe Francione on 02/10/26.
//

#ifndef DATACAT_LOG_SINK_HPP
#define DATACAT_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use them to filter or format output.
 */
enum class LogLevel {
    Debug,   ///< Per-file diagnostics (skips, unchanged files, SQL details)
    Info,    ///< Normal progress of a sync or a query
    Warning, ///< Recorded but absorbed problems (corrupt files, bad names)
    Error    ///< Failures that abort the current operation
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define where log lines end up
 * (console, file, an observer callback). The Logger class fans out
 * every message to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // DATACAT_LOG_SINK_HPP
