//
// Created by Giuseppe Francione on 18/09/25.
//

/**
 * @file thread_pool.hpp
 * @brief Defines a simple, thread-safe fixed-size thread pool.
 *
 * This file contains the ThreadPool class used by WorkerPool to run
 * encodes concurrently.
 */

#ifndef AUDIOPRESS_THREAD_POOL_HPP
#define AUDIOPRESS_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace audiopress {

/**
 * @brief A fixed-size thread pool for executing tasks concurrently.
 *
 * @details Workers are std::jthread, joined automatically on
 * destruction. Tasks wait in a single FIFO queue and each idle worker
 * takes the next one, so a worker that finishes early immediately picks
 * up more work. An exception thrown by a task is stored in the future
 * returned by enqueue().
 */
class ThreadPool {
public:
    /**
     * @brief Constructs the thread pool and starts worker threads.
     * @param threads The number of worker threads to create, at least 1.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());

    /**
     * @brief Destructor.
     * Tasks still queued are discarded, running tasks are joined.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task to be executed by a worker thread.
     *
     * @tparam F A callable taking no arguments.
     * @param f The task to execute.
     * @return A std::future representing the eventual result of the task.
     * @throws std::runtime_error if enqueue is called on a stopped pool.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F>> {
        using return_type = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        auto future = task->get_future();
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task] { (*task)(); });
        }
        condition_.notify_one();
        return future;
    }

    /**
     * @brief Blocks the calling thread until all pending tasks are complete.
     */
    void wait_idle();

    /// @return Number of worker threads.
    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    std::mutex queue_mutex_;                ///< Protects tasks_, stop_, and pending_
    std::condition_variable_any condition_; ///< Notifies workers of new tasks or stop requests
    std::condition_variable idle_cv_;       ///< Notifies wait_idle() when pending_ is zero
    std::queue<std::function<void()>> tasks_; ///< The queue of tasks
    bool stop_{false};                      ///< Flag to signal workers to stop
    size_t pending_{0};                     ///< Number of tasks enqueued or running
    std::vector<std::jthread> workers_;     ///< The worker threads
};

} // namespace audiopress

#endif // AUDIOPRESS_THREAD_POOL_HPP
