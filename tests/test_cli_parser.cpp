//
// Created by Giuseppe Francione on 27/10/25.
//

#include "cli/cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <gtest/gtest.h>
#include <sstream>
#include <vector>

using audiopress::JobOptions;

class CliParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        setup_cli_parser(app_, options_);
    }

    std::optional<int> parse(std::vector<const char*> args) {
        args.insert(args.begin(), "audiopress");
        return parse_command_line(app_, static_cast<int>(args.size()), args.data(), out_, err_);
    }

    CLI::App app_{"audiopress test"};
    JobOptions options_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(CliParserTest, FillsOptions) {
    const auto exit_code = parse({"-i", "music", "-o", "encoded", "-q", "4", "-t", "-30dB",
                                  "-s", "both", "-n", "3", "--encoder", "/opt/ffmpeg",
                                  "--encoder-threads", "2", "--skip-existing", "-v",
                                  "--report", "a.csv", "--report", "b.csv"});

    EXPECT_FALSE(exit_code.has_value());
    EXPECT_EQ(options_.input_root, "music");
    EXPECT_EQ(options_.output_root, "encoded");
    EXPECT_EQ(options_.quality, "4");
    EXPECT_EQ(options_.silence_threshold, "-30dB");
    EXPECT_EQ(options_.silence_mode, "both");
    EXPECT_EQ(options_.parallelism, 3);
    EXPECT_EQ(options_.encoder_path, "/opt/ffmpeg");
    EXPECT_EQ(options_.encoder_threads, 2);
    EXPECT_TRUE(options_.skip_existing);
    EXPECT_TRUE(options_.verbose);
    EXPECT_EQ(options_.report_path, "b.csv");
}

TEST_F(CliParserTest, DefaultsWhenOnlyPathsGiven) {
    EXPECT_FALSE(parse({"-i", "music", "-o", "encoded"}).has_value());
    EXPECT_EQ(options_.quality, "2");
    EXPECT_EQ(options_.silence_threshold, "-45dB");
    EXPECT_EQ(options_.silence_mode, "none");
    EXPECT_EQ(options_.log_file, "audiopress.log");
    EXPECT_EQ(options_.failure_log_file, "audiopress_failures.log");
    EXPECT_FALSE(options_.skip_existing);
}

TEST_F(CliParserTest, MissingRequiredPathPrintsUsage) {
    EXPECT_EQ(parse({"-i", "music"}), 1);
    EXPECT_NE(err_.str().find("--output"), std::string::npos);
}

TEST_F(CliParserTest, HelpExitsWithOne) {
    EXPECT_EQ(parse({"-h"}), 1);
    EXPECT_NE(out_.str().find("--input"), std::string::npos);
}

TEST_F(CliParserTest, UnknownFlagIsUsageError) {
    EXPECT_EQ(parse({"-i", "music", "-o", "encoded", "--bitrate", "320"}), 1);
    EXPECT_NE(err_.str().find("Parse error"), std::string::npos);
}

TEST_F(CliParserTest, ZeroWorkersIsUsageError) {
    EXPECT_EQ(parse({"-i", "music", "-o", "encoded", "-n", "0"}), 1);
    EXPECT_EQ(parse({"-i", "music", "-o", "encoded", "--encoder-threads", "0"}), 1);
}

TEST_F(CliParserTest, VersionExitsWithZero) {
    EXPECT_EQ(parse({"--version"}), 0);
    EXPECT_NE(out_.str().find("0.1"), std::string::npos);
}
