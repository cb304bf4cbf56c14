//
// Created by Giuseppe Francione on 21/10/25.
//

/**
 * @file job_config.hpp
 * @brief Typed configuration of a transcoding run.
 *
 * The CLI fills a JobOptions struct with raw user input. make_job_config()
 * converts it once into a JobConfig whose fields are known to respect
 * their documented constraints; everything downstream works on JobConfig.
 */

#ifndef AUDIOPRESS_JOB_CONFIG_HPP
#define AUDIOPRESS_JOB_CONFIG_HPP

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <thread>

namespace audiopress {

/**
 * @brief Which end(s) of a clip get their silence trimmed.
 */
enum class SilenceMode {
    None,  ///< No filter
    Start, ///< Leading silence only
    End,   ///< Trailing silence only
    Both   ///< Leading and trailing silence ("both" or "all" on the command line)
};

/**
 * @brief Raw, unvalidated options as typed by the user.
 */
struct JobOptions {
    std::string input_root;
    std::string output_root;
    std::string quality = "2";
    std::string silence_threshold = "-45dB";
    std::string silence_mode = "none";
    int parallelism = static_cast<int>(std::max(1U, std::thread::hardware_concurrency()));
    bool verbose = false;

    std::string encoder_path = "ffmpeg";
    int encoder_threads = 1;
    bool skip_existing = false;
    std::string report_path;
    std::string log_file = "audiopress.log";
    std::string failure_log_file = "audiopress_failures.log";
};

/**
 * @brief Validated configuration of a run.
 */
struct JobConfig {
    std::filesystem::path input_root;
    std::filesystem::path output_root;
    int quality = 2;                          ///< VBR quality, 0 (best) to 9
    double silence_threshold_db = -45.0;      ///< Silence detection threshold in dB
    SilenceMode silence_mode = SilenceMode::None;
    unsigned parallelism = 1;                 ///< Number of files encoded concurrently
    bool verbose = false;

    std::string encoder_path = "ffmpeg";      ///< Encoder binary, absolute path or name on PATH
    unsigned encoder_threads = 1;             ///< Thread budget handed to each encoder invocation
    bool skip_existing = false;               ///< Do not re-encode files whose output exists
    std::filesystem::path report_path;        ///< CSV report, empty for none
    std::filesystem::path log_file = "audiopress.log";
    std::filesystem::path failure_log_file = "audiopress_failures.log";
};

/**
 * @brief Parse a VBR quality level.
 * @param text Exactly one decimal digit.
 * @throws ConfigError for anything else ("10", "abc", "2.5", "").
 */
int parse_quality(std::string_view text);

/**
 * @brief Parse a silence threshold such as "-45dB" or "-50.5dB".
 * @return The value in decibels.
 * @throws ConfigError if the text is not a signed decimal followed by "dB".
 */
double parse_threshold(std::string_view text);

/**
 * @brief Parse a silence mode name (none, start, end, both, all).
 * @throws InvalidOptionError on an unknown name.
 */
SilenceMode parse_silence_mode(std::string_view text);

/// @return The canonical name of @p mode ("none", "start", "end", "both").
std::string_view to_string(SilenceMode mode);

/// @return @p db rendered the way the encoder expects it, e.g. "-45dB".
std::string format_threshold(double db);

/**
 * @brief Convert raw options into a typed configuration.
 *
 * Checks everything that can be checked without touching the
 * filesystem: required paths, quality, threshold, silence mode and
 * thread counts.
 *
 * @throws ConfigError describing the first invalid option.
 */
JobConfig make_job_config(const JobOptions& options);

/**
 * @brief Filesystem checks on a configuration.
 *
 * The input root must be an existing directory, the output root must be
 * a directory or not exist yet, and the two must not be the same
 * directory.
 *
 * @throws ConfigError describing the first failed check.
 */
void validate_job_config(const JobConfig& config);

} // namespace audiopress

#endif // AUDIOPRESS_JOB_CONFIG_HPP
