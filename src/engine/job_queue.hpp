#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>

namespace semsearch::engine {

    using Job = std::function<void()>;

    /**
     * @brief Blocking FIFO of jobs shared between submitters and worker threads.
     */
    class JobQueue {
    public:
        /**
         * @return false if the queue is already stopped and the job was not accepted.
         */
        bool push(Job job) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_stop) return false;
                m_queue.push(std::move(job));
            }
            m_cv.notify_one();
            return true;
        }

        /**
         * @brief Waits for the next job. Returns false once stopped and drained.
         */
        bool pop(Job& job) {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || m_stop; });

            if (m_stop && m_queue.empty()) return false;

            job = std::move(m_queue.front());
            m_queue.pop();
            return true;
        }

        void stop() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stop = true;
            }
            m_cv.notify_all();
        }

    private:
        std::queue<Job> m_queue;
        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_stop = false;
    };

}
