//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef AUDIOPRESS_REPORT_HPP
#define AUDIOPRESS_REPORT_HPP

#include "file_task.hpp"
#include "result_aggregator.hpp"
#include <filesystem>
#include <ostream>
#include <vector>

namespace audiopress {

/**
 * @brief Print the end-of-run summary.
 * @param summary Totals of the run.
 * @param out Destination stream (stdout in the CLI).
 */
void print_summary(const RunSummary& summary, std::ostream& out);

/**
 * @brief Write one CSV line per file followed by the run totals.
 *
 * Results are sorted by source path so reports of identical runs are
 * identical.
 *
 * @return false if the report file cannot be written.
 */
bool export_csv_report(const std::vector<FileResult>& results,
                       const RunSummary& summary,
                       const std::filesystem::path& output_path);

} // namespace audiopress

#endif //AUDIOPRESS_REPORT_HPP
