//
// Created by Giuseppe Francione on 25/10/25.
//

#include "errors.hpp"
#include "job_config.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace audiopress;
using audiopress::test::TempDir;
using audiopress::test::write_file;

TEST(ParseQuality, AcceptsEverySingleDigit) {
    for (int q = 0; q <= 9; ++q) {
        EXPECT_EQ(parse_quality(std::to_string(q)), q);
    }
}

TEST(ParseQuality, RejectsAnythingElse) {
    for (const char* bad : {"10", "abc", "", "-1", "2.5", " 2", "2 ", "+3"}) {
        EXPECT_THROW(parse_quality(bad), ConfigError) << "input: '" << bad << "'";
    }
}

TEST(ParseThreshold, ReadsDecibelValues) {
    EXPECT_DOUBLE_EQ(parse_threshold("-45dB"), -45.0);
    EXPECT_DOUBLE_EQ(parse_threshold("-50.5dB"), -50.5);
    EXPECT_DOUBLE_EQ(parse_threshold("+3dB"), 3.0);
    EXPECT_DOUBLE_EQ(parse_threshold("0dB"), 0.0);
}

TEST(ParseThreshold, RejectsMalformedValues) {
    for (const char* bad : {"-45", "dB", "-45db", "-45 dB", "--45dB", "-45.dB", ""}) {
        EXPECT_THROW(parse_threshold(bad), ConfigError) << "input: '" << bad << "'";
    }
}

TEST(ParseThreshold, RejectsOutOfRangeValues) {
    const std::string huge(400, '9');
    EXPECT_THROW(parse_threshold("-" + huge + "dB"), ConfigError);
    EXPECT_THROW(parse_threshold(huge + "dB"), ConfigError);

    JobOptions options;
    options.input_root = "in";
    options.output_root = "out";
    options.silence_threshold = "-" + huge + "dB";
    EXPECT_THROW(make_job_config(options), ConfigError);
}

TEST(ParseSilenceMode, KnownNamesIgnoringCase) {
    EXPECT_EQ(parse_silence_mode("none"), SilenceMode::None);
    EXPECT_EQ(parse_silence_mode("start"), SilenceMode::Start);
    EXPECT_EQ(parse_silence_mode("End"), SilenceMode::End);
    EXPECT_EQ(parse_silence_mode("both"), SilenceMode::Both);
    EXPECT_EQ(parse_silence_mode("ALL"), SilenceMode::Both);
}

TEST(ParseSilenceMode, UnknownNameIsInvalidOption) {
    EXPECT_THROW(parse_silence_mode("middle"), InvalidOptionError);
    EXPECT_THROW(parse_silence_mode(""), InvalidOptionError);
}

TEST(FormatThreshold, KeepsShortestForm) {
    EXPECT_EQ(format_threshold(-45.0), "-45dB");
    EXPECT_EQ(format_threshold(-50.5), "-50.5dB");
    EXPECT_EQ(format_threshold(0.0), "0dB");
    EXPECT_EQ(to_string(SilenceMode::Both), "both");
}

TEST(FormatThreshold, KeepsEveryParsedDigit) {
    EXPECT_EQ(format_threshold(parse_threshold("-45.1234567dB")), "-45.1234567dB");
    EXPECT_EQ(format_threshold(-1000000.0), "-1000000dB");
}

TEST(MakeJobConfig, ConvertsDefaults) {
    JobOptions options;
    options.input_root = "in";
    options.output_root = "out";
    options.parallelism = 3;

    const JobConfig config = make_job_config(options);
    EXPECT_EQ(config.input_root, std::filesystem::path("in"));
    EXPECT_EQ(config.output_root, std::filesystem::path("out"));
    EXPECT_EQ(config.quality, 2);
    EXPECT_DOUBLE_EQ(config.silence_threshold_db, -45.0);
    EXPECT_EQ(config.silence_mode, SilenceMode::None);
    EXPECT_EQ(config.parallelism, 3u);
    EXPECT_EQ(config.encoder_threads, 1u);
    EXPECT_EQ(config.encoder_path, "ffmpeg");
}

TEST(MakeJobConfig, ReportsEveryBadOptionAsConfigError) {
    JobOptions base;
    base.input_root = "in";
    base.output_root = "out";

    auto missing_input = base;
    missing_input.input_root.clear();
    EXPECT_THROW(make_job_config(missing_input), ConfigError);

    auto missing_output = base;
    missing_output.output_root.clear();
    EXPECT_THROW(make_job_config(missing_output), ConfigError);

    auto bad_quality = base;
    bad_quality.quality = "10";
    EXPECT_THROW(make_job_config(bad_quality), ConfigError);

    auto bad_mode = base;
    bad_mode.silence_mode = "sometimes";
    EXPECT_THROW(make_job_config(bad_mode), ConfigError);

    auto no_workers = base;
    no_workers.parallelism = 0;
    EXPECT_THROW(make_job_config(no_workers), ConfigError);

    auto no_encoder_threads = base;
    no_encoder_threads.encoder_threads = 0;
    EXPECT_THROW(make_job_config(no_encoder_threads), ConfigError);

    auto no_encoder = base;
    no_encoder.encoder_path.clear();
    EXPECT_THROW(make_job_config(no_encoder), ConfigError);
}

TEST(ValidateJobConfig, AcceptsMissingOutputDirectory) {
    TempDir tmp;
    std::filesystem::create_directories(tmp / "in");
    JobConfig config;
    config.input_root = tmp / "in";
    config.output_root = tmp / "out";
    EXPECT_NO_THROW(validate_job_config(config));
    EXPECT_FALSE(std::filesystem::exists(tmp / "out"));
}

TEST(ValidateJobConfig, RejectsMissingInput) {
    TempDir tmp;
    JobConfig config;
    config.input_root = tmp / "nowhere";
    config.output_root = tmp / "out";
    EXPECT_THROW(validate_job_config(config), ConfigError);
}

TEST(ValidateJobConfig, RejectsSameRootsSpelledDifferently) {
    TempDir tmp;
    std::filesystem::create_directories(tmp / "music");
    JobConfig config;
    config.input_root = tmp / "music";
    config.output_root = tmp / "music" / ".";
    EXPECT_THROW(validate_job_config(config), ConfigError);
}

TEST(ValidateJobConfig, RejectsOutputThatIsAFile) {
    TempDir tmp;
    std::filesystem::create_directories(tmp / "in");
    write_file(tmp / "out", 4);
    JobConfig config;
    config.input_root = tmp / "in";
    config.output_root = tmp / "out";
    EXPECT_THROW(validate_job_config(config), ConfigError);
}
