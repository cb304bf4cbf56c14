//
// Created by Giuseppe Francione on 25/10/25.
//

#include "errors.hpp"
#include "report.hpp"
#include "result_aggregator.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace audiopress;

namespace {

FileResult ok(const std::string& name, const uintmax_t before, const uintmax_t after) {
    FileResult r;
    r.source_path = "/in/" + name;
    r.dest_path = "/out/" + name;
    r.original_bytes = before;
    r.compressed_bytes = after;
    r.success = true;
    return r;
}

FileResult failed(const std::string& name, const std::string& why) {
    FileResult r;
    r.source_path = "/in/" + name;
    r.dest_path = "/out/" + name;
    r.error_detail = why;
    return r;
}

} // namespace

TEST(AggregateResults, SumsOnlySuccessfulFiles) {
    const std::vector<FileResult> results = {
        ok("a.mp3", 1000, 400), failed("b.mp3", "broken"), ok("c.mp3", 3000, 1600)
    };
    const auto summary = aggregate_results(results, 1.5);
    EXPECT_EQ(summary.files_processed, 2u);
    EXPECT_EQ(summary.files_failed, 1u);
    EXPECT_EQ(summary.total_original_bytes, 4000u);
    EXPECT_EQ(summary.total_compressed_bytes, 2000u);
    EXPECT_EQ(summary.space_saved, 2000);
    EXPECT_DOUBLE_EQ(summary.percent_saved, 50.0);
    EXPECT_DOUBLE_EQ(summary.elapsed_seconds, 1.5);
}

TEST(AggregateResults, IndependentOfCompletionOrder) {
    std::vector<FileResult> results = {
        ok("a.mp3", 10, 7), ok("b.mp3", 200, 150), failed("c.mp3", "x"), ok("d.mp3", 3000, 3100)
    };
    std::ranges::sort(results, [](const auto& a, const auto& b) { return a.source_path < b.source_path; });
    const auto reference = aggregate_results(results);
    do {
        const auto s = aggregate_results(results);
        EXPECT_EQ(s.files_processed, reference.files_processed);
        EXPECT_EQ(s.files_failed, reference.files_failed);
        EXPECT_EQ(s.total_original_bytes, reference.total_original_bytes);
        EXPECT_EQ(s.total_compressed_bytes, reference.total_compressed_bytes);
        EXPECT_EQ(s.space_saved, reference.space_saved);
        EXPECT_DOUBLE_EQ(s.percent_saved, reference.percent_saved);
    } while (std::next_permutation(results.begin(), results.end(),
                                   [](const auto& a, const auto& b) { return a.source_path < b.source_path; }));
}

TEST(AggregateResults, ZeroOriginalBytesMeansZeroPercent) {
    const auto summary = aggregate_results({ok("empty.mp3", 0, 0)});
    EXPECT_EQ(summary.files_processed, 1u);
    EXPECT_DOUBLE_EQ(summary.percent_saved, 0.0);
}

TEST(AggregateResults, GrowthIsNegativeSaving) {
    const auto summary = aggregate_results({ok("a.mp3", 1000, 1500)});
    EXPECT_EQ(summary.space_saved, -500);
    EXPECT_DOUBLE_EQ(summary.percent_saved, -50.0);
}

TEST(RequireResults, ThrowsWhenNothingSucceeded) {
    EXPECT_THROW(require_results(aggregate_results({})), AggregationError);
    EXPECT_THROW(require_results(aggregate_results({failed("a.mp3", "x")})), AggregationError);
    EXPECT_NO_THROW(require_results(aggregate_results({ok("a.mp3", 1, 1)})));
}

TEST(FormatIecBytes, UsesBinaryUnits) {
    EXPECT_EQ(format_iec_bytes(0), "0 B");
    EXPECT_EQ(format_iec_bytes(512), "512 B");
    EXPECT_EQ(format_iec_bytes(1023), "1023 B");
    EXPECT_EQ(format_iec_bytes(1024), "1.00 KiB");
    EXPECT_EQ(format_iec_bytes(1536), "1.50 KiB");
    EXPECT_EQ(format_iec_bytes(1024 * 1024), "1.00 MiB");
    EXPECT_EQ(format_iec_bytes(5ull * 1024 * 1024 * 1024), "5.00 GiB");
    EXPECT_EQ(format_signed_iec_bytes(-1536), "-1.50 KiB");
    EXPECT_EQ(format_signed_iec_bytes(100), "100 B");
}

TEST(PrintSummary, ReportsTotals) {
    const auto summary = aggregate_results({ok("a.mp3", 2048, 1024), failed("b.mp3", "x")}, 2.0);
    std::ostringstream out;
    print_summary(summary, out);
    const auto text = out.str();
    EXPECT_NE(text.find("Processed 1 file (1 failed, see failure log)"), std::string::npos);
    EXPECT_NE(text.find("Original size:   2.00 KiB"), std::string::npos);
    EXPECT_NE(text.find("Compressed size: 1.00 KiB"), std::string::npos);
    EXPECT_NE(text.find("Space saved:     1.00 KiB (50.00%)"), std::string::npos);
    EXPECT_NE(text.find("Elapsed time:    2.00 s"), std::string::npos);
}

TEST(ExportCsvReport, WritesRowsSortedBySource) {
    audiopress::test::TempDir tmp;
    const std::vector<FileResult> results = {
        failed("z,quoted.mp3", "said \"no\""), ok("a.mp3", 1000, 250)
    };
    const auto report = tmp / "report.csv";
    ASSERT_TRUE(export_csv_report(results, aggregate_results(results, 1.0), report));

    std::ifstream in(report);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    ASSERT_GE(lines.size(), 3u);
    EXPECT_EQ(lines[0], "Source,Destination,Before(bytes),After(bytes),Delta(%),Time(s),Result,Error");
    EXPECT_EQ(lines[1], "/in/a.mp3,/out/a.mp3,1000,250,75.00,0.00,OK,");
    EXPECT_EQ(lines[2], "\"/in/z,quoted.mp3\",\"/out/z,quoted.mp3\",0,0,0.00,0.00,FAIL,\"said \"\"no\"\"\"");
    EXPECT_EQ(lines.back(), "1,1,1000,250,75.00,1.00");
}

TEST(ExportCsvReport, UnwritablePathReturnsFalse) {
    EXPECT_FALSE(export_csv_report({}, RunSummary{}, "/nonexistent-dir/report.csv"));
}
