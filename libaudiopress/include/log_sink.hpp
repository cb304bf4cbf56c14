//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef AUDIOPRESS_LOG_SINK_HPP
#define AUDIOPRESS_LOG_SINK_HPP

#include <string_view>

namespace audiopress {

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use these to filter or format output.
 */
enum class LogLevel {
    Debug,   ///< Per-file diagnostics, successful encodes
    Info,    ///< Normal operation: discovery, dispatch, summary
    Warning, ///< Unexpected but recoverable states
    Error    ///< Per-file failures and fatal configuration problems
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define where log lines go (console, file).
 * A sink must write each message as one uninterrupted line, because
 * the Logger is called from every worker thread.
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

} // namespace audiopress

#endif // AUDIOPRESS_LOG_SINK_HPP
