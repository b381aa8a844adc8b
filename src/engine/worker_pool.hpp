#pragma once

#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>
#include "job_queue.hpp"
#include "semsearch/errors.hpp"

namespace semsearch::engine {

    /**
     * @brief Fixed set of threads draining a JobQueue.
     * Destruction stops intake, finishes queued jobs and joins every thread.
     */
    class WorkerPool {
    public:
        explicit WorkerPool(size_t threads);
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        /**
         * @brief Queues fn and returns a future for its result.
         * Exceptions thrown by fn are delivered through the future.
         */
        template <typename F>
        auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
            using R = std::invoke_result_t<std::decay_t<F>>;
            auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
            auto future = task->get_future();
            if (!m_queue.push([task]() { (*task)(); })) {
                throw InternalError("WorkerPool is shutting down");
            }
            return future;
        }

        size_t size() const { return m_threads.size(); }

    private:
        JobQueue m_queue;
        std::vector<std::thread> m_threads;
    };

}
