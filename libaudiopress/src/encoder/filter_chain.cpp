//
// Created by Giuseppe Francione on 22/10/25.
//

#include "../../include/filter_chain.hpp"
#include "../../include/errors.hpp"

namespace audiopress {

std::string FilterStage::render() const {
    const std::string trim = "silenceremove=start_periods=1:start_threshold=" + format_threshold(threshold_db);
    if (anchor == TrimAnchor::StreamStart) {
        return trim;
    }
    // trailing silence is trimmed as the leading silence of the reversed stream
    return "areverse," + trim + ",areverse";
}

std::vector<FilterStage> build_silence_filters(const SilenceMode mode, const double threshold_db) {
    switch (mode) {
        case SilenceMode::None:
            return {};
        case SilenceMode::Start:
            return {FilterStage{TrimAnchor::StreamStart, threshold_db}};
        case SilenceMode::End:
            return {FilterStage{TrimAnchor::StreamEnd, threshold_db}};
        case SilenceMode::Both:
            return {FilterStage{TrimAnchor::StreamStart, threshold_db},
                    FilterStage{TrimAnchor::StreamEnd, threshold_db}};
    }
    throw InvalidOptionError("Unknown silence mode value " + std::to_string(static_cast<int>(mode)));
}

std::string render_filter_chain(const std::vector<FilterStage>& stages) {
    std::string chain;
    for (const auto& stage : stages) {
        if (!chain.empty()) {
            chain += ',';
        }
        chain += stage.render();
    }
    return chain;
}

} // namespace audiopress
