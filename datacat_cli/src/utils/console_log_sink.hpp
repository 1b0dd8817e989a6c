//
// Created by Giuseppe Francione on 12/10/26.
//

#ifndef DATACAT_CONSOLE_LOG_SINK_HPP
#define DATACAT_CONSOLE_LOG_SINK_HPP

#include "../../../libdatacat/include/log_sink.hpp"
#include "color.hpp"
#include <iostream>

/**
 * @brief Writes log lines at or above log_level to stderr.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (static_cast<int>(level) < static_cast<int>(log_level)) return;
        switch (level) {
            case LogLevel::Debug:
                std::cerr << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cerr << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << YELLOW << "[WARN ][" << tag << "] " << message << RESET << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << RED << "[ERROR][" << tag << "] " << message << RESET << std::endl;
                break;
        }
    }
};

#endif // DATACAT_CONSOLE_LOG_SINK_HPP
