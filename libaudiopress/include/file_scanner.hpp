//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef AUDIOPRESS_FILE_SCANNER_HPP
#define AUDIOPRESS_FILE_SCANNER_HPP

#include "logger.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace audiopress {

/**
 * @brief Recursively collect audio files below @p input_root.
 *
 * Matches regular files whose extension is one of @p extensions
 * (compared case-insensitively, dot included). Junk files
 * (".DS_Store", "._*") and anything below @p exclude_root are skipped,
 * so an output tree nested in the input tree is never re-encoded.
 * Unreadable directories are logged and skipped.
 *
 * @return Matching files in sorted order.
 */
std::vector<std::filesystem::path>
collect_audio_files(const std::filesystem::path& input_root,
                    const std::filesystem::path& exclude_root,
                    Logger& logger,
                    const std::vector<std::string>& extensions = {".mp3"});

} // namespace audiopress

#endif //AUDIOPRESS_FILE_SCANNER_HPP
