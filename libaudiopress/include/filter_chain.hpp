//
// Created by Giuseppe Francione on 22/10/25.
//

/**
 * @file filter_chain.hpp
 * @brief Silence-trimming filter stages handed to the encoder.
 */

#ifndef AUDIOPRESS_FILTER_CHAIN_HPP
#define AUDIOPRESS_FILTER_CHAIN_HPP

#include "job_config.hpp"
#include <string>
#include <vector>

namespace audiopress {

/**
 * @brief Where a trim stage looks for silence.
 */
enum class TrimAnchor {
    StreamStart, ///< Remove silence before the first sound
    StreamEnd    ///< Remove silence after the last sound
};

/**
 * @brief One silence-trim operation.
 *
 * Detection is one-shot: only the first run of silence at the anchor is
 * removed, gaps inside the clip are left untouched.
 */
struct FilterStage {
    TrimAnchor anchor = TrimAnchor::StreamStart;
    double threshold_db = -45.0;

    /// @return The stage in ffmpeg filtergraph syntax.
    [[nodiscard]] std::string render() const;

    bool operator==(const FilterStage&) const = default;
};

/**
 * @brief Translate a silence mode into filter stages.
 *
 * None yields no stage, Start and End one stage each, Both a start
 * stage followed by an end stage. All stages share @p threshold_db.
 *
 * @throws InvalidOptionError if @p mode is not a known enumerator.
 */
std::vector<FilterStage> build_silence_filters(SilenceMode mode, double threshold_db);

/// @return The stages joined into one filtergraph, empty for no stages.
std::string render_filter_chain(const std::vector<FilterStage>& stages);

} // namespace audiopress

#endif // AUDIOPRESS_FILTER_CHAIN_HPP
