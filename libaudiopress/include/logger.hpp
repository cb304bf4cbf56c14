//
// Created by Giuseppe Francione on 20/10/25.
//

/**
 * @file logger.hpp
 * @brief Provides a thread-safe logging facade.
 *
 * This file defines the Logger class. One Logger is created by the
 * application and handed by reference to every component that logs;
 * it delegates log messages to one or more registered ILogSink
 * implementations.
 */

#ifndef AUDIOPRESS_LOGGER_HPP
#define AUDIOPRESS_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace audiopress {

/**
 * @brief Logging facade for audiopress.
 *
 * Thread-safe: workers log concurrently while the orchestrator may
 * still be adding sinks. Messages are delivered to all sinks in
 * registration order.
 */
class Logger {
public:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Add a new log sink to the logger.
     * The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "audiopress").
     */
    void log(LogLevel level,
             std::string_view msg,
             std::string_view tag = "audiopress");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     * @param level The enum value.
     * @return A constant string (e.g., "DEBUG", "INFO").
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

private:
    ///< List of all registered sink implementations.
    std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    std::mutex mtx_;
};

} // namespace audiopress

#endif //AUDIOPRESS_LOGGER_HPP
