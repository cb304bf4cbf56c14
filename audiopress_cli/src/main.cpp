//
// Created by Giuseppe Francione on 18/09/25.
//

#include <iostream>
#include <memory>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "cli/cli_parser.hpp"
#include "../../libaudiopress/include/errors.hpp"
#include "../../libaudiopress/include/ffmpeg_encoder.hpp"
#include "../../libaudiopress/include/job_config.hpp"
#include "../../libaudiopress/include/logger.hpp"
#include "../../libaudiopress/include/orchestrator.hpp"

using namespace audiopress;

int main(int argc, char* argv[]) {

    CLI::App app{"audiopress: batch MP3 recompression through ffmpeg."};
    JobOptions options;
    setup_cli_parser(app, options);

    if (const auto exit_code = parse_command_line(app, argc, argv, std::cout, std::cerr)) {
        return *exit_code;
    }

    JobConfig config;
    try {
        config = make_job_config(options);
    } catch (const ConfigError& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }

    Logger logger;

    auto general_sink = std::make_unique<FileLogSink>(config.log_file, LogLevel::Debug);
    if (!general_sink->is_open()) {
        std::cerr << YELLOW << "Warning: cannot open log file " << config.log_file.string() << RESET << std::endl;
    }
    logger.add_sink(std::move(general_sink));

    auto failure_sink = std::make_unique<FileLogSink>(config.failure_log_file, LogLevel::Error);
    if (!failure_sink->is_open()) {
        std::cerr << YELLOW << "Warning: cannot open failure log " << config.failure_log_file.string() << RESET << std::endl;
    }
    logger.add_sink(std::move(failure_sink));

    if (config.verbose) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = LogLevel::Debug;
        logger.add_sink(std::move(console_sink));
    }

    FfmpegEncoder encoder(config.encoder_path);
    Orchestrator orchestrator(config, encoder, logger);

    try {
        const RunOutcome outcome = orchestrator.run(std::cout, std::cerr);
        return outcome.exit_code();
    } catch (const std::exception& e) {
        logger.log(LogLevel::Error, std::string("Unexpected error: ") + e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }
}
