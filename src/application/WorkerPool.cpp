/**
 * @file WorkerPool.cpp
 * @brief Implementation of WorkerPool.
 */

#include "application/WorkerPool.hpp"
#include <algorithm>
#include <iostream>

namespace streamscribe::application {

WorkerPool::WorkerPool(size_t workerCount, size_t queueCapacity, Handler handler)
    : m_workerCount(std::max<size_t>(1, workerCount)),
      m_capacity(std::max<size_t>(1, queueCapacity)),
      m_handler(std::move(handler)) {
    m_workers.reserve(m_workerCount);
    for (size_t i = 0; i < m_workerCount; ++i) {
        m_workers.emplace_back(&WorkerPool::workerLoop, this, i);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(domain::Fragment fragment) {
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notFull.wait(lock, [this] {
            return m_queue.size() < m_capacity || !m_accepting;
        });
        if (!m_accepting) {
            return false;
        }
        m_queue.push_back(std::move(fragment));
    }
    m_notEmpty.notify_one();
    return true;
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle.wait(lock, [this] {
        return m_queue.empty() && m_inFlight == 0;
    });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_accepting = false;
    }
    m_notEmpty.notify_all();
    m_notFull.notify_all();

    std::lock_guard<std::mutex> joinLock(m_joinMutex);
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

size_t WorkerPool::inFlight() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inFlight;
}

void WorkerPool::workerLoop(size_t index) {
    while (true) {
        domain::Fragment fragment;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_notEmpty.wait(lock, [this] {
                return !m_queue.empty() || !m_accepting;
            });

            if (m_queue.empty()) {
                return; // Shutting down and nothing left to drain
            }

            fragment = std::move(m_queue.front());
            m_queue.pop_front();
            ++m_inFlight;
        }
        m_notFull.notify_one();

        // Process outside lock
        try {
            m_handler(fragment);
        } catch (const std::exception& e) {
            ++m_crashed;
            std::cerr << "[WorkerPool] Worker " << index << " caught error on " << fragment.filename
                      << ": " << e.what() << std::endl;
        } catch (...) {
            ++m_crashed;
            std::cerr << "[WorkerPool] Worker " << index << " caught unknown error on " << fragment.filename << std::endl;
        }
        ++m_completed;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_inFlight;
            if (m_queue.empty() && m_inFlight == 0) {
                m_idle.notify_all();
            }
        }
    }
}

} // namespace streamscribe::application
