//
// Created by Giuseppe Francione on 22/10/25.
//

#ifndef AUDIOPRESS_PROCESS_RUNNER_HPP
#define AUDIOPRESS_PROCESS_RUNNER_HPP

#include <string>
#include <vector>

namespace audiopress {

    /**
     * @brief Exit status and stderr of a finished child process.
     */
    struct ProcessResult {
        int exit_code = 0;       ///< Exit status, 128 + signal number if killed, 127 if exec failed
        std::string diagnostics; ///< Tail of what the child wrote to stderr
    };

    /**
     * @brief Run a program and wait for it.
     *
     * argv[0] is looked up on PATH when it contains no slash. The child
     * reads from /dev/null, its stdout is discarded and its stderr is
     * captured. Safe to call from several threads at once.
     *
     * @param argv Program name followed by its arguments, must not be empty.
     * @param max_diagnostics Only the last @p max_diagnostics bytes of stderr are kept.
     * @throws std::runtime_error if the process cannot be spawned at all
     * (pipe or fork failure).
     */
    ProcessResult run_process(const std::vector<std::string>& argv,
                              std::size_t max_diagnostics = 16 * 1024);

} // namespace audiopress

#endif // AUDIOPRESS_PROCESS_RUNNER_HPP
