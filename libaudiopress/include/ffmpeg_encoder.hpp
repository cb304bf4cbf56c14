//
// Created by Giuseppe Francione on 22/10/25.
//

/**
 * @file ffmpeg_encoder.hpp
 * @brief IEncoder implementation driving the ffmpeg command line tool.
 */

#ifndef AUDIOPRESS_FFMPEG_ENCODER_HPP
#define AUDIOPRESS_FFMPEG_ENCODER_HPP

#include "encoder.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace audiopress {

    /**
     * @brief Encodes MP3 files by spawning ffmpeg with libmp3lame.
     *
     * @details Every call to encode() runs one ffmpeg process and blocks
     * until it exits. The instance holds no per-file state, so one
     * encoder is shared by all workers.
     */
    class FfmpegEncoder final : public IEncoder {
    public:
        /**
         * @param executable Path to ffmpeg, or a bare name looked up on PATH.
         */
        explicit FfmpegEncoder(std::string executable = "ffmpeg");

        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "ffmpeg";
        }

        [[nodiscard]] bool is_available() const override;

        EncodeOutcome encode(const EncodeRequest& request) override;

        /**
         * @brief Build the full command line for @p request.
         * @return argv, starting with the executable.
         */
        [[nodiscard]] std::vector<std::string> build_arguments(const EncodeRequest& request) const;

        /**
         * @brief Locate an executable.
         *
         * A name containing a slash is checked as-is, anything else is
         * searched in the directories of the PATH environment variable.
         *
         * @return The executable's path, or std::nullopt if not found.
         */
        static std::optional<std::filesystem::path> find_executable(const std::string& name);

    private:
        std::string executable_;
    };

} // namespace audiopress

#endif // AUDIOPRESS_FFMPEG_ENCODER_HPP
