//
// Created by Giuseppe Francione on 23/10/25.
//

#include "../../include/result_aggregator.hpp"
#include "../../include/errors.hpp"
#include <array>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace audiopress {

RunSummary aggregate_results(const std::vector<FileResult>& results, const double elapsed_seconds) {
    RunSummary summary;
    summary.elapsed_seconds = elapsed_seconds;

    for (const auto& r : results) {
        if (!r.success) {
            ++summary.files_failed;
            continue;
        }
        ++summary.files_processed;
        summary.total_original_bytes += r.original_bytes;
        summary.total_compressed_bytes += r.compressed_bytes;
    }

    summary.space_saved = static_cast<intmax_t>(summary.total_original_bytes) -
                          static_cast<intmax_t>(summary.total_compressed_bytes);
    if (summary.total_original_bytes > 0) {
        summary.percent_saved = static_cast<double>(summary.space_saved) /
                                static_cast<double>(summary.total_original_bytes) * 100.0;
    }
    return summary;
}

void require_results(const RunSummary& summary) {
    if (summary.files_processed == 0) {
        throw AggregationError("No file was encoded successfully (" +
                               std::to_string(summary.files_failed) + " failed).");
    }
}

std::string format_iec_bytes(const uintmax_t bytes) {
    static constexpr std::array<std::string_view, 5> kUnits = {"B", "KiB", "MiB", "GiB", "TiB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    auto value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << kUnits[unit];
    return oss.str();
}

std::string format_signed_iec_bytes(const intmax_t bytes) {
    if (bytes < 0) {
        return "-" + format_iec_bytes(static_cast<uintmax_t>(-(bytes + 1)) + 1);
    }
    return format_iec_bytes(static_cast<uintmax_t>(bytes));
}

} // namespace audiopress
