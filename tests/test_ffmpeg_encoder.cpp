//
// Created by Giuseppe Francione on 25/10/25.
//

#include "ffmpeg_encoder.hpp"
#include "process_runner.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <gtest/gtest.h>

using namespace audiopress;

namespace {

EncodeRequest sample_request() {
    EncodeRequest request;
    request.input_path = "/music/a.mp3";
    request.output_path = "/encoded/a.mp3";
    request.quality = 4;
    request.thread_budget = 2;
    return request;
}

std::string value_after(const std::vector<std::string>& args, const std::string& flag) {
    const auto it = std::ranges::find(args, flag);
    if (it == args.end() || std::next(it) == args.end()) {
        return {};
    }
    return *std::next(it);
}

} // namespace

TEST(FfmpegEncoder, ArgumentsWithoutFilters) {
    const FfmpegEncoder encoder("/opt/ffmpeg");
    const std::vector<std::string> expected = {
        "/opt/ffmpeg", "-hide_banner", "-nostdin", "-loglevel", "error", "-y",
        "-i", "/music/a.mp3",
        "-map_metadata", "0",
        "-codec:a", "libmp3lame", "-q:a", "4", "-threads", "2",
        "/encoded/a.mp3"
    };
    EXPECT_EQ(encoder.build_arguments(sample_request()), expected);
}

TEST(FfmpegEncoder, ArgumentsCarryFilterChain) {
    auto request = sample_request();
    request.filters = build_silence_filters(SilenceMode::Both, -45.0);
    const auto args = FfmpegEncoder().build_arguments(request);
    EXPECT_EQ(args.front(), "ffmpeg");
    EXPECT_EQ(value_after(args, "-af"), render_filter_chain(request.filters));
    EXPECT_EQ(value_after(args, "-q:a"), "4");
    EXPECT_EQ(args.back(), "/encoded/a.mp3");
}

TEST(FfmpegEncoder, MetadataCopyCanBeDisabled) {
    auto request = sample_request();
    request.preserve_metadata = false;
    const auto args = FfmpegEncoder().build_arguments(request);
    EXPECT_EQ(std::ranges::find(args, "-map_metadata"), args.end());
}

TEST(FfmpegEncoder, FindsExecutables) {
    EXPECT_TRUE(FfmpegEncoder::find_executable("/bin/sh").has_value());
    EXPECT_TRUE(FfmpegEncoder::find_executable("sh").has_value());
    EXPECT_FALSE(FfmpegEncoder::find_executable("audiopress-no-such-encoder").has_value());
    EXPECT_FALSE(FfmpegEncoder::find_executable("/nonexistent/ffmpeg").has_value());
    EXPECT_FALSE(FfmpegEncoder::find_executable("").has_value());
}

TEST(FfmpegEncoder, MissingBinaryIsUnavailable) {
    EXPECT_FALSE(FfmpegEncoder("audiopress-no-such-encoder").is_available());
    EXPECT_TRUE(FfmpegEncoder("/bin/sh").is_available());
}

TEST(FfmpegEncoder, NonZeroExitIsReported) {
    FfmpegEncoder encoder("/bin/false");
    const auto outcome = encoder.encode(sample_request());
    EXPECT_FALSE(outcome.ok());
    EXPECT_NE(outcome.exit_code, 0);
}

TEST(ProcessRunner, CapturesExitCodeAndStderr) {
    const auto result = run_process({"/bin/sh", "-c", "echo oops >&2; echo ignored; exit 3"});
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.diagnostics, "oops\n");
}

TEST(ProcessRunner, KeepsTailOfLongDiagnostics) {
    const auto result = run_process({"/bin/sh", "-c", "printf 'abcdefghij' >&2"}, 4);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.diagnostics, "ghij");
}

TEST(ProcessRunner, ExecFailureIs127) {
    const auto result = run_process({"/nonexistent/audiopress-encoder"});
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.diagnostics.find("/nonexistent/audiopress-encoder"), std::string::npos);
}

TEST(ProcessRunner, KilledChildReportsSignal) {
    const auto result = run_process({"/bin/sh", "-c", "kill -9 $$"});
    EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST(ProcessRunner, EmptyArgvIsRejected) {
    EXPECT_THROW(run_process({}), std::invalid_argument);
}
