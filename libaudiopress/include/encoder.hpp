//
// Created by Giuseppe Francione on 22/10/25.
//

/**
 * @file encoder.hpp
 * @brief Abstract interface of the external audio encoder.
 */

#ifndef AUDIOPRESS_ENCODER_HPP
#define AUDIOPRESS_ENCODER_HPP

#include "filter_chain.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace audiopress {

/**
 * @brief Everything one encoder invocation needs.
 */
struct EncodeRequest {
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    std::vector<FilterStage> filters;  ///< Applied in order, may be empty
    int quality = 2;                   ///< VBR quality level, 0 (best) to 9
    unsigned thread_budget = 1;        ///< Threads the encoder may use for this file
    bool preserve_metadata = true;     ///< Copy tags from input to output
};

/**
 * @brief What the encoder reported back.
 */
struct EncodeOutcome {
    int exit_code = 0;       ///< 0 on success
    std::string diagnostics; ///< Diagnostic output captured from the encoder

    [[nodiscard]] bool ok() const noexcept { return exit_code == 0; }
};

/**
 * @brief The encoding capability used by EncodeInvoker.
 *
 * @details The production implementation spawns an external binary;
 * tests substitute a fake. encode() is called concurrently from every
 * worker thread and must not rely on shared mutable state.
 */
class IEncoder {
public:
    virtual ~IEncoder() = default;

    /// @return Human-readable name of the encoder (e.g. "ffmpeg").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return True if the encoder can be invoked on this machine.
    [[nodiscard]] virtual bool is_available() const = 0;

    /**
     * @brief Encode one file.
     *
     * A failing encode is reported through the outcome, not by throwing.
     */
    virtual EncodeOutcome encode(const EncodeRequest& request) = 0;
};

} // namespace audiopress

#endif // AUDIOPRESS_ENCODER_HPP
