//
// Created by Giuseppe Francione on 24/10/25.
//

#include "../../include/orchestrator.hpp"
#include "../../include/encode_invoker.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_scanner.hpp"
#include "../../include/path_mirror.hpp"
#include "../../include/progress_reporter.hpp"
#include "../../include/report.hpp"
#include "../../include/worker_pool.hpp"
#include <iterator>
#include <thread>

namespace fs = std::filesystem;

namespace audiopress {

static const char* orchestrator_tag() {
    return "Orchestrator";
}

Orchestrator::Orchestrator(JobConfig config, IEncoder& encoder, Logger& logger)
    : config_(std::move(config)),
      encoder_(encoder),
      logger_(logger) {
}

void Orchestrator::validate() const {
    validate_job_config(config_);
    if (!encoder_.is_available()) {
        throw ConfigError("Required encoder '" + config_.encoder_path + "' (" +
                          std::string(encoder_.get_name()) + ") was not found.");
    }
}

TaskPlan plan_tasks(const std::vector<fs::path>& files, const JobConfig& config, Logger& logger) {
    TaskPlan plan;
    plan.tasks.reserve(files.size());
    for (const auto& file : files) {
        FileTask task;
        try {
            task = FileTask{file, PathMirror::mirror(config.input_root, config.output_root, file)};
        } catch (const PerFileError& e) {
            logger.log(LogLevel::Error, "Failed " + file.string() + ": " + e.what(), orchestrator_tag());
            FileResult rejected;
            rejected.source_path = file;
            rejected.error_detail = e.what();
            plan.rejected.push_back(std::move(rejected));
            continue;
        }
        std::error_code ec;
        if (config.skip_existing && fs::exists(task.dest_path, ec)) {
            logger.log(LogLevel::Info, "Skipping " + file.string() + ": output already exists", orchestrator_tag());
            ++plan.skipped;
            continue;
        }
        plan.tasks.push_back(std::move(task));
    }
    return plan;
}

TaskPlan Orchestrator::discover(std::ostream& out, RunStatus& status) const {
    const auto files = collect_audio_files(config_.input_root, config_.output_root, logger_);
    if (files.empty()) {
        logger_.log(LogLevel::Info, "No MP3 files found in " + config_.input_root.string(), orchestrator_tag());
        out << "No MP3 files found in " << config_.input_root.string() << "\n";
        status = RunStatus::NothingToDo;
        return {};
    }

    auto plan = plan_tasks(files, config_, logger_);
    if (plan.tasks.empty() && plan.rejected.empty()) {
        out << "All " << plan.skipped << " MP3 files already encoded in " << config_.output_root.string() << "\n";
        status = RunStatus::NothingToDo;
    }
    return plan;
}

std::vector<FileResult> Orchestrator::dispatch(const std::vector<FileTask>& tasks, std::ostream& err) {
    logger_.log(LogLevel::Info,
                "Encoding " + std::to_string(tasks.size()) + " files with " +
                std::to_string(config_.parallelism) + " workers (quality " + std::to_string(config_.quality) +
                ", silence " + std::string(to_string(config_.silence_mode)) + " at " +
                format_threshold(config_.silence_threshold_db) + ")",
                orchestrator_tag());

    const EncodeInvoker invoker(encoder_, EncodeOptions::from_config(config_), logger_);
    WorkerPool pool(config_.parallelism);
    CompletionCounter counter;
    ProgressReporter reporter(err, progress_interval_);

    // unwinding out of pool.run stops the reporter through the jthread destructor
    std::jthread progress([&](const std::stop_token& stop) { reporter.observe(tasks.size(), counter, stop); });
    auto results = pool.run(tasks,
                            [&invoker](const FileTask& task) { return invoker.encode(task); },
                            counter);
    progress.join();
    return results;
}

RunOutcome Orchestrator::run(std::ostream& out, std::ostream& err) {
    RunOutcome outcome;
    const auto start = std::chrono::steady_clock::now();

    try {
        validate();
    } catch (const ConfigError& e) {
        logger_.log(LogLevel::Error, e.what(), orchestrator_tag());
        err << "Error: " << e.what() << "\n";
        outcome.status = RunStatus::ConfigFailed;
        return outcome;
    }

    RunStatus discover_status = RunStatus::Completed;
    auto plan = discover(out, discover_status);
    if (plan.tasks.empty() && plan.rejected.empty()) {
        outcome.status = discover_status;
        return outcome;
    }

    if (!plan.tasks.empty()) {
        outcome.results = dispatch(plan.tasks, err);
    }
    outcome.results.insert(outcome.results.end(),
                           std::make_move_iterator(plan.rejected.begin()),
                           std::make_move_iterator(plan.rejected.end()));

    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    outcome.summary = aggregate_results(outcome.results, elapsed);

    try {
        require_results(outcome.summary);
    } catch (const AggregationError& e) {
        logger_.log(LogLevel::Error, e.what(), orchestrator_tag());
        err << "Error: " << e.what() << "\n";
        outcome.status = RunStatus::NoResults;
        return outcome;
    }

    print_summary(outcome.summary, out);
    logger_.log(LogLevel::Info,
                "Done: " + std::to_string(outcome.summary.files_processed) + " encoded, " +
                std::to_string(outcome.summary.files_failed) + " failed, " +
                format_signed_iec_bytes(outcome.summary.space_saved) + " saved",
                orchestrator_tag());

    if (!config_.report_path.empty() &&
        !export_csv_report(outcome.results, outcome.summary, config_.report_path)) {
        logger_.log(LogLevel::Warning, "Cannot write report to " + config_.report_path.string(), orchestrator_tag());
    }

    outcome.status = RunStatus::Completed;
    return outcome;
}

} // namespace audiopress
