//
// Created by Giuseppe Francione on 23/10/25.
//

#include "../../include/worker_pool.hpp"
#include "../../include/thread_pool.hpp"
#include <algorithm>
#include <exception>
#include <future>
#include <utility>

namespace audiopress {

void ResultCollector::append(FileResult result) {
    std::lock_guard lock(mtx_);
    results_.push_back(std::move(result));
}

size_t ResultCollector::size() const {
    std::lock_guard lock(mtx_);
    return results_.size();
}

std::vector<FileResult> ResultCollector::take() {
    std::lock_guard lock(mtx_);
    return std::exchange(results_, {});
}

WorkerPool::WorkerPool(const unsigned parallelism)
    : parallelism_(std::max(1U, parallelism)) {
}

FileResult WorkerPool::run_one(const FileTask& task, const TaskFunction& fn) {
    FileResult result;
    try {
        result = fn(task);
    } catch (const std::exception& e) {
        result = FileResult{};
        result.source_path = task.source_path;
        result.dest_path = task.dest_path;
        result.success = false;
        result.error_detail = e.what();
    }
    return result;
}

std::vector<FileResult> WorkerPool::run(const std::vector<FileTask>& tasks,
                                        const TaskFunction& fn,
                                        CompletionCounter& counter) {
    if (tasks.empty()) {
        return {};
    }

    ResultCollector collector;
    std::vector<std::future<void>> futures;
    futures.reserve(tasks.size());
    {
        const auto threads = static_cast<unsigned>(std::min<size_t>(parallelism_, tasks.size()));
        ThreadPool pool(threads);

        for (const auto& task : tasks) {
            futures.push_back(pool.enqueue([&task, &fn, &collector, &counter] {
                // the counter must advance even if the task escapes with a non-std exception
                struct CompletionGuard {
                    CompletionCounter& counter;
                    ~CompletionGuard() { counter.increment(); }
                } guard{counter};
                collector.append(run_one(task, fn));
            }));
        }
        pool.wait_idle();
    }

    for (auto& f : futures) {
        f.get();
    }
    return collector.take();
}

std::vector<FileResult> WorkerPool::run(const std::vector<FileTask>& tasks, const TaskFunction& fn) {
    CompletionCounter counter;
    return run(tasks, fn, counter);
}

} // namespace audiopress
