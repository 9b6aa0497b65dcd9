/**
 * @file WorkerPool.hpp
 * @brief Fixed set of executor threads fed by a bounded fragment queue.
 */

#pragma once
#include "domain/Fragment.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace streamscribe::application {

/**
 * @class WorkerPool
 * @brief Runs one handler call per submitted fragment on N worker threads.
 *
 * submit() blocks while the queue is full instead of dropping work. A worker
 * finishes its current fragment before taking the next one. Exceptions
 * escaping the handler are logged and counted; the worker keeps running.
 */
class WorkerPool {
public:
    using Handler = std::function<void(domain::Fragment&)>;

    /**
     * @param workerCount Number of executor threads (at least one).
     * @param queueCapacity Maximum queued fragments not yet claimed (at least one).
     * @param handler Work performed for each fragment.
     */
    WorkerPool(size_t workerCount, size_t queueCapacity, Handler handler);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queues a fragment, waiting for room if the queue is full.
     * @return False if the pool is shutting down and the fragment was not queued.
     */
    bool submit(domain::Fragment fragment);

    /** @brief Blocks until the queue is empty and no handler is running. */
    void waitIdle();

    /**
     * @brief Stops accepting work, lets queued and running fragments finish,
     *        then joins the workers. Safe to call more than once.
     */
    void shutdown();

    size_t workerCount() const { return m_workerCount; }
    size_t queueCapacity() const { return m_capacity; }
    size_t queued() const;
    size_t inFlight() const;
    size_t completed() const { return m_completed.load(); }
    size_t crashed() const { return m_crashed.load(); }

private:
    void workerLoop(size_t index);

    const size_t m_workerCount;
    const size_t m_capacity;
    Handler m_handler;

    std::deque<domain::Fragment> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
    std::condition_variable m_idle;
    size_t m_inFlight = 0;
    bool m_accepting = true;

    std::mutex m_joinMutex;
    std::vector<std::thread> m_workers;

    std::atomic<size_t> m_completed{0};
    std::atomic<size_t> m_crashed{0};
};

} // namespace streamscribe::application
