//
// Created by Giuseppe Francione on 22/10/25.
//

#ifndef AUDIOPRESS_FILE_TASK_HPP
#define AUDIOPRESS_FILE_TASK_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace audiopress {

/**
 * @brief One file to encode. Created at discovery, consumed once by a worker.
 */
struct FileTask {
    std::filesystem::path source_path; ///< Discovered input file
    std::filesystem::path dest_path;   ///< Mirrored location below the output root
};

/**
 * @brief Outcome of encoding one file.
 */
struct FileResult {
    std::filesystem::path source_path;
    std::filesystem::path dest_path;
    uintmax_t original_bytes = 0;             ///< Size of the source, valid when success
    uintmax_t compressed_bytes = 0;           ///< Size of the output, valid when success
    bool success = false;
    std::optional<std::string> error_detail;  ///< Reason of the failure
    std::chrono::milliseconds duration{0};    ///< Time spent on this file
};

} // namespace audiopress

#endif // AUDIOPRESS_FILE_TASK_HPP
