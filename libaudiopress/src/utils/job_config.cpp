//
// Created by Giuseppe Francione on 21/10/25.
//

#include "../../include/job_config.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <regex>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace audiopress {

int parse_quality(const std::string_view text) {
    static const std::regex quality_pattern("^[0-9]$");
    const std::string value(text);
    if (!std::regex_match(value, quality_pattern)) {
        throw ConfigError("Invalid quality '" + value + "': must be a single digit between 0 and 9.");
    }
    return value[0] - '0';
}

double parse_threshold(const std::string_view text) {
    static const std::regex threshold_pattern("^([+-]?[0-9]+(\\.[0-9]+)?)dB$");
    const std::string value(text);
    std::smatch match;
    if (!std::regex_match(value, match, threshold_pattern)) {
        throw ConfigError("Invalid silence threshold '" + value + "': expected a decibel value such as -45dB.");
    }
    try {
        return std::stod(match[1].str());
    } catch (const std::out_of_range&) {
        throw ConfigError("Invalid silence threshold '" + value + "': value out of range.");
    }
}

SilenceMode parse_silence_mode(const std::string_view text) {
    std::string name(text);
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    if (name == "none")  return SilenceMode::None;
    if (name == "start") return SilenceMode::Start;
    if (name == "end")   return SilenceMode::End;
    if (name == "both" || name == "all") return SilenceMode::Both;
    throw InvalidOptionError("Unknown silence mode '" + std::string(text) +
                             "'. Must be one of: none, start, end, both, all.");
}

std::string_view to_string(const SilenceMode mode) {
    switch (mode) {
        case SilenceMode::None:  return "none";
        case SilenceMode::Start: return "start";
        case SilenceMode::End:   return "end";
        case SilenceMode::Both:  return "both";
    }
    return "unknown";
}

std::string format_threshold(const double db) {
    // fixed notation, shortest form that reads back to the same value
    std::array<char, 400> buf{};
    const auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), db, std::chars_format::fixed);
    if (ec != std::errc{}) {
        throw ConfigError("Cannot format silence threshold: " + std::make_error_code(ec).message());
    }
    return std::string(buf.data(), end) + "dB";
}

JobConfig make_job_config(const JobOptions& options) {
    if (options.input_root.empty()) {
        throw ConfigError("Input directory (-i) is required.");
    }
    if (options.output_root.empty()) {
        throw ConfigError("Output directory (-o) is required.");
    }

    JobConfig config;
    config.input_root = options.input_root;
    config.output_root = options.output_root;
    config.quality = parse_quality(options.quality);
    config.silence_threshold_db = parse_threshold(options.silence_threshold);

    try {
        config.silence_mode = parse_silence_mode(options.silence_mode);
    } catch (const InvalidOptionError& e) {
        throw ConfigError(e.what());
    }

    if (options.parallelism <= 0) {
        throw ConfigError("Invalid number of parallel jobs '" + std::to_string(options.parallelism) +
                          "': must be a positive integer.");
    }
    config.parallelism = static_cast<unsigned>(options.parallelism);

    if (options.encoder_threads <= 0) {
        throw ConfigError("Invalid encoder thread budget '" + std::to_string(options.encoder_threads) +
                          "': must be a positive integer.");
    }
    config.encoder_threads = static_cast<unsigned>(options.encoder_threads);

    if (options.encoder_path.empty()) {
        throw ConfigError("Encoder path must not be empty.");
    }
    config.encoder_path = options.encoder_path;

    config.verbose = options.verbose;
    config.skip_existing = options.skip_existing;
    config.report_path = options.report_path;
    config.log_file = options.log_file;
    config.failure_log_file = options.failure_log_file;
    return config;
}

void validate_job_config(const JobConfig& config) {
    std::error_code ec;
    if (!fs::is_directory(config.input_root, ec)) {
        throw ConfigError("Input directory '" + config.input_root.string() + "' does not exist.");
    }

    if (fs::exists(config.output_root, ec) && !fs::is_directory(config.output_root, ec)) {
        throw ConfigError("Output path '" + config.output_root.string() + "' exists and is not a directory.");
    }

    const auto input = fs::weakly_canonical(config.input_root, ec);
    if (ec) {
        throw ConfigError("Cannot resolve input directory '" + config.input_root.string() + "': " + ec.message());
    }
    const auto output = fs::weakly_canonical(config.output_root, ec);
    if (ec) {
        throw ConfigError("Cannot resolve output directory '" + config.output_root.string() + "': " + ec.message());
    }
    if (input == output) {
        throw ConfigError("Input and output directories must be different.");
    }
}

} // namespace audiopress
