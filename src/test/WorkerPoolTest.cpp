#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "application/WorkerPool.hpp"

using namespace streamscribe::application;
using streamscribe::domain::Fragment;

static Fragment MakeFragment(int seq) {
    Fragment f;
    f.sequence = seq;
    f.filename = "chunk_" + std::to_string(seq) + ".wav";
    f.path = f.filename;
    return f;
}

int main() {
    std::cout << "[Test] Starting Worker Pool Test..." << std::endl;

    // Each fragment handled exactly once, never by two workers at the same time
    {
        const int NUM_FRAGMENTS = 100;
        const size_t WORKERS = 4;
        std::vector<std::atomic<int>> runs(NUM_FRAGMENTS);
        std::vector<std::atomic<int>> active(NUM_FRAGMENTS);
        for (int i = 0; i < NUM_FRAGMENTS; ++i) {
            runs[i] = 0;
            active[i] = 0;
        }
        std::atomic<int> concurrent{0};
        std::atomic<int> peak{0};
        std::atomic<bool> overlap{false};

        WorkerPool pool(WORKERS, 10, [&](Fragment& f) {
            if (active[f.sequence].fetch_add(1) != 0) {
                overlap = true;
            }
            int now = ++concurrent;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            ++runs[f.sequence];
            --concurrent;
            --active[f.sequence];
        });

        for (int i = 0; i < NUM_FRAGMENTS; ++i) {
            bool accepted = pool.submit(MakeFragment(i));
            assert(accepted);
            assert(pool.queued() <= pool.queueCapacity());
        }
        pool.waitIdle();

        for (int i = 0; i < NUM_FRAGMENTS; ++i) {
            assert(runs[i] == 1);
        }
        assert(!overlap);
        assert(peak.load() <= static_cast<int>(WORKERS));
        assert(pool.completed() == NUM_FRAGMENTS);
        assert(pool.crashed() == 0);
        assert(pool.inFlight() == 0);
        pool.shutdown();
    }
    std::cout << "[PASS] 100 fragments, 4 workers: each handled once." << std::endl;

    // A throwing handler does not kill its worker
    {
        std::atomic<int> handled{0};
        WorkerPool pool(2, 4, [&](Fragment& f) {
            if (f.sequence % 3 == 0) {
                throw std::runtime_error("decoder exploded");
            }
            ++handled;
        });
        for (int i = 0; i < 30; ++i) {
            pool.submit(MakeFragment(i));
        }
        pool.waitIdle();
        assert(pool.crashed() == 10);
        assert(handled == 20);
        assert(pool.completed() == 30);
        pool.shutdown();
    }
    std::cout << "[PASS] Worker survives handler exceptions." << std::endl;

    // Backpressure: submit blocks while the queue is full
    {
        std::mutex gate;
        gate.lock();
        WorkerPool pool(1, 2, [&](Fragment&) {
            std::lock_guard<std::mutex> wait(gate);
        });

        // One in the worker, two in the queue
        for (int i = 0; i < 3; ++i) {
            pool.submit(MakeFragment(i));
        }

        std::atomic<bool> fourthQueued{false};
        std::thread producer([&]() {
            pool.submit(MakeFragment(3));
            fourthQueued = true;
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        assert(!fourthQueued);
        assert(pool.queued() <= 2);

        gate.unlock();
        producer.join();
        assert(fourthQueued);
        pool.waitIdle();
        assert(pool.completed() == 4);
        pool.shutdown();
    }
    std::cout << "[PASS] Full queue blocks the producer." << std::endl;

    // Shutdown drains queued work, then refuses new submissions
    {
        std::atomic<int> handled{0};
        WorkerPool pool(2, 8, [&](Fragment&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ++handled;
        });
        for (int i = 0; i < 8; ++i) {
            pool.submit(MakeFragment(i));
        }
        pool.shutdown();
        assert(handled == 8);
        bool accepted = pool.submit(MakeFragment(99));
        assert(!accepted);
        pool.shutdown(); // second call is harmless
    }
    std::cout << "[PASS] Shutdown drains then rejects." << std::endl;

    std::cout << "[Test] Worker Pool Test completed." << std::endl;
    return 0;
}
