#include "worker_pool.hpp"

namespace semsearch::engine {

    WorkerPool::WorkerPool(size_t threads) {
        if (threads == 0) threads = 1;
        m_threads.reserve(threads);
        for (size_t i = 0; i < threads; ++i) {
            m_threads.emplace_back([this]() {
                Job job;
                while (m_queue.pop(job)) {
                    job();
                }
            });
        }
    }

    WorkerPool::~WorkerPool() {
        m_queue.stop();
        for (auto& t : m_threads) {
            if (t.joinable()) t.join();
        }
    }

}
