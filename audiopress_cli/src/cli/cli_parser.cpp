//
// Created by Giuseppe Francione on 20/09/25.
//

#include "cli_parser.hpp"
#include "../utils/color.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, audiopress::JobOptions& options) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Required paths ---
    app.add_option("-i,--input", options.input_root,
                   "Directory scanned recursively for MP3 files.")
                   ->required();

    app.add_option("-o,--output", options.output_root,
                   "Directory receiving the encoded files, mirroring the input tree.")
                   ->required();

    // --- Encoding ---
    app.add_option("-q,--quality", options.quality,
                   "VBR quality, a single digit from 0 (best) to 9.")
                   ->default_val(options.quality);

    app.add_option("-t,--threshold", options.silence_threshold,
                   "Silence threshold in decibels, e.g. -45dB.")
                   ->default_val(options.silence_threshold);

    app.add_option("-s,--silence", options.silence_mode,
                   "Silence trimming: none, start, end, both (or all).")
                   ->default_val(options.silence_mode);

    app.add_option("-n,--threads", options.parallelism,
                   "Files encoded in parallel.")
                   ->default_val(options.parallelism)
                   ->check(CLI::PositiveNumber);

    app.add_option("--encoder", options.encoder_path,
                   "ffmpeg executable, absolute path or name looked up on PATH.")
                   ->default_val(options.encoder_path);

    app.add_option("--encoder-threads", options.encoder_threads,
                   "Threads each encoder process may use.")
                   ->default_val(options.encoder_threads)
                   ->check(CLI::PositiveNumber);

    app.add_flag("--skip-existing", options.skip_existing,
                 "Do not re-encode files whose output already exists.");

    // --- Output ---
    app.add_flag("-v,--verbose", options.verbose,
                 "Mirror every log line to the console.");

    app.add_option("--report", options.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    app.add_option("--log-file", options.log_file,
                   "General log, appended to.")
                   ->default_val(options.log_file);

    app.add_option("--failure-log", options.failure_log_file,
                   "Log of failed files only, appended to.")
                   ->default_val(options.failure_log_file);
}

std::optional<int> parse_command_line(CLI::App& app, const int argc, const char* const* argv,
                                      std::ostream& out, std::ostream& err) {
    // usage errors, including -h, exit with 1
    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &) {
        out << app.help();
        return 1;
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e, out, err);
    }
    catch (const CLI::ParseError &e) {
        err << RED << "Parse error: " << e.what() << RESET << "\n\n" << app.help();
        return 1;
    }
    return std::nullopt;
}
