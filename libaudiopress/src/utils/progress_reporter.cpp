//
// Created by Giuseppe Francione on 23/10/25.
//

#include "../../include/progress_reporter.hpp"
#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace audiopress {

    ProgressReporter::ProgressReporter(std::ostream& out, const std::chrono::milliseconds interval)
        : out_(out),
          interval_(interval) {
    }

    std::string ProgressReporter::render(const size_t processed, const size_t total) {
        const size_t shown = std::min(processed, total);
        const size_t percent = total ? shown * 100 / total : 100;
        return std::to_string(shown) + "/" + std::to_string(total) + " (" + std::to_string(percent) + "%)";
    }

    void ProgressReporter::observe(const size_t total, const CompletionCounter& counter, const std::stop_token& stop) {
        std::mutex mtx;
        std::condition_variable_any wake;
        std::unique_lock lock(mtx);
        for (;;) {
            const size_t done = counter.load();
            out_ << "\r" << render(done, total) << std::flush;
            if (done >= total || stop.stop_requested()) {
                out_ << "\n" << std::flush;
                return;
            }
            // woken early only by a stop request
            wake.wait_for(lock, stop, interval_, [] { return false; });
        }
    }

} // namespace audiopress
