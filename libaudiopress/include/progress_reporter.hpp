//
// Created by Giuseppe Francione on 23/10/25.
//

#ifndef AUDIOPRESS_PROGRESS_REPORTER_HPP
#define AUDIOPRESS_PROGRESS_REPORTER_HPP

#include "worker_pool.hpp"
#include <chrono>
#include <cstddef>
#include <ostream>
#include <stop_token>
#include <string>

namespace audiopress {

    /**
     * @brief Renders a transient "processed/total (percent%)" status line.
     *
     * @details observe() is meant to run on its own thread next to the
     * workers. It only reads the CompletionCounter and never waits on
     * anything the workers hold.
     */
    class ProgressReporter {
    public:
        explicit ProgressReporter(std::ostream& out,
                                  std::chrono::milliseconds interval = std::chrono::seconds(1));

        /**
         * @brief Poll @p counter every interval until it reaches @p total
         * or @p stop is requested.
         *
         * Each poll rewrites the status line in place. The final line is
         * terminated with a newline before returning.
         */
        void observe(size_t total, const CompletionCounter& counter, const std::stop_token& stop = {});

        /// @return "processed/total (percent%)", processed clamped to total.
        [[nodiscard]] static std::string render(size_t processed, size_t total);

    private:
        std::ostream& out_;
        std::chrono::milliseconds interval_;
    };

} // namespace audiopress

#endif // AUDIOPRESS_PROGRESS_REPORTER_HPP
