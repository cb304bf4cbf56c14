//
// Created by Giuseppe Francione on 22/10/25.
//

/**
 * @file encode_invoker.hpp
 * @brief Runs the encoder on one file and measures the result.
 */

#ifndef AUDIOPRESS_ENCODE_INVOKER_HPP
#define AUDIOPRESS_ENCODE_INVOKER_HPP

#include "encoder.hpp"
#include "file_task.hpp"
#include "job_config.hpp"
#include "logger.hpp"
#include <filesystem>

namespace audiopress {

/**
 * @brief Encoder settings shared by every file of a run.
 */
struct EncodeOptions {
    int quality = 2;
    double silence_threshold_db = -45.0;
    SilenceMode silence_mode = SilenceMode::None;
    unsigned thread_budget = 1;
    bool preserve_metadata = true;

    static EncodeOptions from_config(const JobConfig& config);
};

/**
 * @brief Turns a FileTask into a FileResult using an IEncoder.
 *
 * @details encode() never throws for problems limited to one file:
 * same source and destination, directories that cannot be created, unknown
 * options and encoder failures all end up in FileResult::error_detail
 * and in the log at Error level. Successful encodes are logged at
 * Debug level. The invoker is stateless and shared by all workers.
 */
class EncodeInvoker {
public:
    EncodeInvoker(IEncoder& encoder, EncodeOptions options, Logger& logger);

    /// Encode task.source_path into task.dest_path.
    [[nodiscard]] FileResult encode(const FileTask& task) const;

    [[nodiscard]] FileResult encode(const std::filesystem::path& source_path,
                                    const std::filesystem::path& dest_path) const;

    [[nodiscard]] const EncodeOptions& options() const noexcept { return options_; }

private:
    /// @throws SameFileError if both paths designate the same file.
    static void check_distinct(const std::filesystem::path& source_path,
                               const std::filesystem::path& dest_path);

    IEncoder& encoder_;
    EncodeOptions options_;
    Logger& logger_;
};

} // namespace audiopress

#endif // AUDIOPRESS_ENCODE_INVOKER_HPP
