//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef AUDIOPRESS_CLI_PARSER_HPP
#define AUDIOPRESS_CLI_PARSER_HPP

#include "../../../libaudiopress/include/job_config.hpp"
#include <optional>
#include <ostream>

// forward declaration
namespace CLI { class App; }

/**
 * @brief Configures the CLI11 parser with all options and flags.
 *
 * Options are bound as raw text; range and format checks happen in
 * audiopress::make_job_config() so the CLI and the library agree on
 * what is valid.
 *
 * @param app The CLI::App instance to configure.
 * @param options The JobOptions struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, audiopress::JobOptions& options);

/**
 * @brief Parses the command line into the options bound by setup_cli_parser().
 *
 * Usage errors print the help text and yield 1, including -h. --version
 * prints the version and yields 0.
 *
 * @return The process exit code when the program must stop, std::nullopt
 *         when parsing succeeded and the run should go on.
 */
std::optional<int> parse_command_line(CLI::App& app, int argc, const char* const* argv,
                                      std::ostream& out, std::ostream& err);

#endif //AUDIOPRESS_CLI_PARSER_HPP
