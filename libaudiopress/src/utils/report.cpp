//
// Created by Giuseppe Francione on 20/09/25.
//

#include "../../include/report.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace audiopress {

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string fixed2(const double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

void print_summary(const RunSummary& summary, std::ostream& out) {
    out << "\nProcessed " << summary.files_processed << " file"
        << (summary.files_processed == 1 ? "" : "s");
    if (summary.files_failed > 0) {
        out << " (" << summary.files_failed << " failed, see failure log)";
    }
    out << "\n"
        << std::left << std::setw(17) << "Original size:"   << format_iec_bytes(summary.total_original_bytes) << "\n"
        << std::left << std::setw(17) << "Compressed size:" << format_iec_bytes(summary.total_compressed_bytes) << "\n"
        << std::left << std::setw(17) << "Space saved:"     << format_signed_iec_bytes(summary.space_saved)
        << " (" << fixed2(summary.percent_saved) << "%)\n"
        << std::left << std::setw(17) << "Elapsed time:"    << fixed2(summary.elapsed_seconds) << " s\n";
}

bool export_csv_report(const std::vector<FileResult>& results,
                       const RunSummary& summary,
                       const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Source,Destination,Before(bytes),After(bytes),Delta(%),Time(s),Result,Error\n";

    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.source_path < b.source_path;
    });

    for (const auto& r : sorted) {
        const double pct = r.success && r.original_bytes
                         ? 100.0 * (1.0 - static_cast<double>(r.compressed_bytes) / static_cast<double>(r.original_bytes))
                         : 0.0;
        out << csv_escape(r.source_path.string()) << ","
            << csv_escape(r.dest_path.string()) << ","
            << r.original_bytes << ","
            << r.compressed_bytes << ","
            << fixed2(pct) << ","
            << fixed2(static_cast<double>(r.duration.count()) / 1000.0) << ","
            << (r.success ? "OK" : "FAIL") << ","
            << csv_escape(r.error_detail.value_or("")) << "\n";
    }

    out << "\n\nFiles processed,Files failed,Total before(bytes),Total after(bytes),Saved(%),Total time(s)\n";
    out << summary.files_processed << ","
        << summary.files_failed << ","
        << summary.total_original_bytes << ","
        << summary.total_compressed_bytes << ","
        << fixed2(summary.percent_saved) << ","
        << fixed2(summary.elapsed_seconds) << "\n";
    return static_cast<bool>(out);
}

} // namespace audiopress
