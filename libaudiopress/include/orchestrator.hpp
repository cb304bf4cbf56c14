//
// Created by Giuseppe Francione on 24/10/25.
//

/**
 * @file orchestrator.hpp
 * @brief Drives a complete transcoding run.
 *
 * The Orchestrator walks through Validate, Discover, Dispatch, Aggregate
 * and Report exactly once, in that order.
 */

#ifndef AUDIOPRESS_ORCHESTRATOR_HPP
#define AUDIOPRESS_ORCHESTRATOR_HPP

#include "encoder.hpp"
#include "file_task.hpp"
#include "job_config.hpp"
#include "logger.hpp"
#include "result_aggregator.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <ostream>
#include <vector>

namespace audiopress {

/**
 * @brief How a run ended.
 */
enum class RunStatus {
    Completed,    ///< At least one file encoded, summary printed
    NothingToDo,  ///< No input file found, or all outputs already present
    ConfigFailed, ///< Validation failed before any work started
    NoResults     ///< Files were dispatched but none was encoded
};

/**
 * @brief Everything a run produced.
 */
struct RunOutcome {
    RunStatus status = RunStatus::Completed;
    RunSummary summary;
    std::vector<FileResult> results;

    /// @return Process exit code: 0 for Completed and NothingToDo, 1 otherwise.
    [[nodiscard]] int exit_code() const noexcept {
        return status == RunStatus::Completed || status == RunStatus::NothingToDo ? 0 : 1;
    }
};

/**
 * @brief Validates the configuration, discovers input files, encodes
 * them on a WorkerPool while a ProgressReporter runs, and prints the
 * summary.
 *
 * @details Individual file failures never stop the run; they are logged
 * by EncodeInvoker and counted in the summary. The run only fails when
 * the configuration is invalid or when no file at all was encoded.
 */
/// Discovered files split by what the run will do with them.
struct TaskPlan {
    std::vector<FileTask> tasks;       ///< Files to encode
    std::vector<FileResult> rejected;  ///< Failed before encoding, counted as failures
    size_t skipped = 0;                ///< Outputs already present, with skip_existing
};

/**
 * @brief Mirror every discovered file into the output root.
 *
 * A file whose destination cannot be computed becomes a failed result
 * in TaskPlan::rejected and is logged at Error level.
 */
TaskPlan plan_tasks(const std::vector<std::filesystem::path>& files, const JobConfig& config, Logger& logger);

class Orchestrator {
public:
    /**
     * @param config Validated by make_job_config(); filesystem checks happen in run().
     * @param encoder Encoder shared by all workers.
     * @param logger Receives discovery, per-file and summary messages.
     */
    Orchestrator(JobConfig config, IEncoder& encoder, Logger& logger);

    /// Poll interval of the progress line (default one second).
    void set_progress_interval(std::chrono::milliseconds interval) { progress_interval_ = interval; }

    /**
     * @brief Execute the run.
     * @param out Receives the "no files" message and the summary.
     * @param err Receives the progress line and fatal error messages.
     */
    RunOutcome run(std::ostream& out, std::ostream& err);

    [[nodiscard]] const JobConfig& config() const noexcept { return config_; }

private:
    /// @throws ConfigError
    void validate() const;

    /// @return Tasks for every discovered file, minus skipped ones.
    TaskPlan discover(std::ostream& out, RunStatus& status) const;

    std::vector<FileResult> dispatch(const std::vector<FileTask>& tasks, std::ostream& err);

    JobConfig config_;
    IEncoder& encoder_;
    Logger& logger_;
    std::chrono::milliseconds progress_interval_{1000};
};

} // namespace audiopress

#endif // AUDIOPRESS_ORCHESTRATOR_HPP
