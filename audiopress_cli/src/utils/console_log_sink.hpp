//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef AUDIOPRESS_CONSOLE_LOG_SINK_HPP
#define AUDIOPRESS_CONSOLE_LOG_SINK_HPP

#include "../../../libaudiopress/include/log_sink.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Mirrors log lines to the console (verbose mode).
 *
 * Debug and Info go to stdout, Warning and Error to stderr. Lines start
 * with a carriage return so they overwrite the transient progress line.
 */
class ConsoleLogSink final : public audiopress::ILogSink {
public:
    audiopress::LogLevel log_level = audiopress::LogLevel::Error;

    void log(const audiopress::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case audiopress::LogLevel::Debug:
                std::cout << "\r[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case audiopress::LogLevel::Info:
                std::cout << "\r[INFO ][" << tag << "] " << message << std::endl;
                break;
            case audiopress::LogLevel::Warning:
                std::cerr << "\r[WARN ][" << tag << "] " << message << std::endl;
                break;
            case audiopress::LogLevel::Error:
                std::cerr << "\r[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // AUDIOPRESS_CONSOLE_LOG_SINK_HPP
