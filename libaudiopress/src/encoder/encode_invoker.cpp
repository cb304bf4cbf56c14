//
// Created by Giuseppe Francione on 22/10/25.
//

#include "../../include/encode_invoker.hpp"
#include "../../include/errors.hpp"
#include "../../include/filter_chain.hpp"
#include "../../include/path_mirror.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace audiopress {

namespace {

const char* invoker_tag() {
    return "EncodeInvoker";
}

std::string trim(std::string s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

EncodeOptions EncodeOptions::from_config(const JobConfig& config) {
    EncodeOptions options;
    options.quality = config.quality;
    options.silence_threshold_db = config.silence_threshold_db;
    options.silence_mode = config.silence_mode;
    options.thread_budget = config.encoder_threads;
    return options;
}

EncodeInvoker::EncodeInvoker(IEncoder& encoder, EncodeOptions options, Logger& logger)
    : encoder_(encoder),
      options_(options),
      logger_(logger) {
}

FileResult EncodeInvoker::encode(const FileTask& task) const {
    return encode(task.source_path, task.dest_path);
}

void EncodeInvoker::check_distinct(const fs::path& source_path, const fs::path& dest_path) {
    if (source_path.lexically_normal() == dest_path.lexically_normal()) {
        throw SameFileError("Source and destination are the same file: " + source_path.string());
    }
    std::error_code ec;
    if (fs::exists(dest_path, ec) && fs::equivalent(source_path, dest_path, ec)) {
        throw SameFileError("Source and destination are the same file: " + source_path.string());
    }
}

FileResult EncodeInvoker::encode(const fs::path& source_path, const fs::path& dest_path) const {
    FileResult result;
    result.source_path = source_path;
    result.dest_path = dest_path;

    const auto start = std::chrono::steady_clock::now();
    bool encoder_ran = false;

    try {
        check_distinct(source_path, dest_path);

        EncodeRequest request;
        request.input_path = source_path;
        request.output_path = dest_path;
        request.filters = build_silence_filters(options_.silence_mode, options_.silence_threshold_db);
        request.quality = options_.quality;
        request.thread_budget = options_.thread_budget;
        request.preserve_metadata = options_.preserve_metadata;

        std::error_code ec;
        const auto original_size = fs::file_size(source_path, ec);
        if (ec) {
            throw EncodeFailure("Cannot read size of " + source_path.string() + ": " + ec.message());
        }

        PathMirror::ensure_parent_directory(dest_path);

        encoder_ran = true;
        const EncodeOutcome outcome = encoder_.encode(request);
        if (!outcome.ok()) {
            std::string detail = std::string(encoder_.get_name()) + " exited with code " +
                                 std::to_string(outcome.exit_code);
            const std::string diagnostics = trim(outcome.diagnostics);
            if (!diagnostics.empty()) {
                detail += ": " + diagnostics;
            }
            throw EncodeFailure(detail);
        }

        const auto compressed_size = fs::file_size(dest_path, ec);
        if (ec) {
            throw EncodeFailure("Encoder reported success but produced no output at " + dest_path.string());
        }

        result.original_bytes = original_size;
        result.compressed_bytes = compressed_size;
        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.error_detail = e.what();
        if (encoder_ran) {
            // do not leave a truncated output behind
            std::error_code ec;
            fs::remove(dest_path, ec);
        }
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (result.success) {
        logger_.log(LogLevel::Debug,
                    "Encoded " + source_path.string() + " -> " + dest_path.string() +
                    " (" + std::to_string(result.original_bytes) + " -> " +
                    std::to_string(result.compressed_bytes) + " bytes)",
                    invoker_tag());
    } else {
        logger_.log(LogLevel::Error,
                    "Failed " + source_path.string() + ": " + result.error_detail.value_or("unknown error"),
                    invoker_tag());
    }
    return result;
}

} // namespace audiopress
