//
// Created by Giuseppe Francione on 23/10/25.
//

/**
 * @file result_aggregator.hpp
 * @brief Sums per-file results into the totals of a run.
 */

#ifndef AUDIOPRESS_RESULT_AGGREGATOR_HPP
#define AUDIOPRESS_RESULT_AGGREGATOR_HPP

#include "file_task.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace audiopress {

/**
 * @brief Totals of a run, derived once every worker is done.
 */
struct RunSummary {
    size_t files_processed = 0;        ///< Successfully encoded files
    size_t files_failed = 0;           ///< Files that ended in an error
    uintmax_t total_original_bytes = 0;
    uintmax_t total_compressed_bytes = 0;
    intmax_t space_saved = 0;          ///< Negative if outputs grew
    double percent_saved = 0.0;        ///< 0 when nothing was measured
    double elapsed_seconds = 0.0;
};

/**
 * @brief Sum the sizes of all successful results.
 *
 * Failed results only increment files_failed. The totals do not depend
 * on the order of @p results.
 *
 * @param results One entry per processed file.
 * @param elapsed_seconds Wall time of the run, copied into the summary.
 */
RunSummary aggregate_results(const std::vector<FileResult>& results, double elapsed_seconds = 0.0);

/**
 * @brief Fail if the run produced nothing to report.
 * @throws AggregationError if no file was encoded successfully.
 */
void require_results(const RunSummary& summary);

/**
 * @brief Human-readable size in binary units.
 *
 * Below 1 KiB the exact byte count is shown ("512 B"); above, the value
 * is scaled to KiB, MiB, GiB or TiB with two decimals ("1.50 KiB").
 */
std::string format_iec_bytes(uintmax_t bytes);

/// format_iec_bytes() with a leading '-' for negative values.
std::string format_signed_iec_bytes(intmax_t bytes);

} // namespace audiopress

#endif // AUDIOPRESS_RESULT_AGGREGATOR_HPP
