//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef AUDIOPRESS_FILE_LOG_SINK_HPP
#define AUDIOPRESS_FILE_LOG_SINK_HPP

#include "../../../libaudiopress/include/log_sink.hpp"
#include "../../../libaudiopress/include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>

/**
 * @brief Appends timestamped log lines to a file.
 *
 * Messages below min_level are dropped, which lets the same class back
 * both the general log and the failure-only log.
 */
class FileLogSink final : public audiopress::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename,
                         const audiopress::LogLevel min_level = audiopress::LogLevel::Debug,
                         const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc),
          min_level_(min_level) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const audiopress::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open() || level < min_level_) return;

        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::lock_guard lock(mtx_);
        out_ << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "]"
             << "[" << audiopress::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    audiopress::LogLevel min_level_;
    std::mutex mtx_;
};

#endif // AUDIOPRESS_FILE_LOG_SINK_HPP
