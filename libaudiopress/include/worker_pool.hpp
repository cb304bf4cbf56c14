//
// Created by Giuseppe Francione on 23/10/25.
//

/**
 * @file worker_pool.hpp
 * @brief Bounded-concurrency dispatch of FileTasks.
 *
 * Also defines the two pieces of state shared between workers and the
 * observers of a run: the completion counter and the result collection.
 */

#ifndef AUDIOPRESS_WORKER_POOL_HPP
#define AUDIOPRESS_WORKER_POOL_HPP

#include "file_task.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace audiopress {

/**
 * @brief Monotonic count of finished files, successful or not.
 *
 * Incremented once per file by the worker that handled it, polled by
 * ProgressReporter. Readers may lag behind; progress is advisory.
 */
class CompletionCounter {
public:
    /// @return The value after incrementing.
    size_t increment() noexcept {
        return value_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    [[nodiscard]] size_t load() const noexcept {
        return value_.load(std::memory_order_acquire);
    }

private:
    std::atomic<size_t> value_{0};
};

/**
 * @brief Append-only collection of FileResults, safe for concurrent append.
 *
 * Read with take() only once every worker is done.
 */
class ResultCollector {
public:
    void append(FileResult result);

    [[nodiscard]] size_t size() const;

    /// @return All collected results, leaving the collector empty.
    std::vector<FileResult> take();

private:
    mutable std::mutex mtx_;
    std::vector<FileResult> results_;
};

/**
 * @brief Runs one function per FileTask on a bounded set of threads.
 *
 * @details At most `parallelism` files are processed at the same time;
 * a worker that finishes takes the next queued task. run() returns only
 * when every task has completed, with exactly one FileResult per task,
 * in no particular order. A task that throws is recorded as a failed
 * result instead of aborting the others.
 */
class WorkerPool {
public:
    using TaskFunction = std::function<FileResult(const FileTask&)>;

    /// @param parallelism Maximum number of concurrent tasks, at least 1.
    explicit WorkerPool(unsigned parallelism);

    /**
     * @brief Process all tasks and wait for them.
     * @param tasks Files to process.
     * @param fn Called once per task, from a worker thread.
     * @param counter Incremented once per finished task.
     * @return One result per task.
     */
    std::vector<FileResult> run(const std::vector<FileTask>& tasks,
                                const TaskFunction& fn,
                                CompletionCounter& counter);

    /// Same as above with a private counter.
    std::vector<FileResult> run(const std::vector<FileTask>& tasks, const TaskFunction& fn);

    [[nodiscard]] unsigned parallelism() const noexcept { return parallelism_; }

private:
    static FileResult run_one(const FileTask& task, const TaskFunction& fn);

    unsigned parallelism_;
};

} // namespace audiopress

#endif // AUDIOPRESS_WORKER_POOL_HPP
