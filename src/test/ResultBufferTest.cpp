#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "application/ResultBuffer.hpp"
#include "domain/PipelineErrors.hpp"

using namespace streamscribe::application;
using namespace streamscribe::domain;

int main() {
    std::cout << "[Test] Starting Result Buffer Test..." << std::endl;

    // Contiguous prefix only
    {
        ResultBuffer buffer;
        for (int seq : {0, 1, 2, 4, 5}) {
            buffer.insert(seq, "text " + std::to_string(seq));
        }

        DrainResult run = buffer.drainContiguousFrom(0);
        assert(run.results.size() == 3);
        assert(run.results[0].sequence == 0);
        assert(run.results[2].sequence == 2);
        assert(run.results[1].text == "text 1");
        assert(run.newCursor == 3);
        assert(buffer.size() == 2);
        assert((buffer.sequences() == std::vector<std::int64_t>{4, 5}));

        // Gap at 3 blocks everything after it
        DrainResult stalled = buffer.drainContiguousFrom(3);
        assert(stalled.empty());
        assert(stalled.newCursor == 3);
        assert(buffer.size() == 2);

        buffer.insert(3, "late");
        DrainResult rest = buffer.drainContiguousFrom(3);
        assert(rest.results.size() == 3);
        assert(rest.results.front().text == "late");
        assert(rest.newCursor == 6);
        assert(buffer.size() == 0);
    }
    std::cout << "[PASS] Drain stops at the first gap." << std::endl;

    // Duplicates keep the first value
    {
        ResultBuffer buffer;
        buffer.insert(7, "first");
        bool threw = false;
        try {
            buffer.insert(7, "second");
        } catch (const DuplicateSequence& e) {
            threw = true;
            assert(e.sequence() == 7);
        }
        assert(threw);
        assert(buffer.size() == 1);
        DrainResult run = buffer.drainContiguousFrom(7);
        assert(run.results.size() == 1 && run.results[0].text == "first");
    }
    std::cout << "[PASS] Duplicate sequence rejected." << std::endl;

    // Restore after a failed write
    {
        ResultBuffer buffer;
        buffer.insert(0, "a");
        buffer.insert(1, "b");
        DrainResult run = buffer.drainContiguousFrom(0);
        assert(buffer.size() == 0);
        buffer.restore(run.results);
        assert(buffer.size() == 2);
        DrainResult again = buffer.drainContiguousFrom(0);
        assert(again.results.size() == 2 && again.results[1].text == "b");
    }
    std::cout << "[PASS] Restore puts a run back." << std::endl;

    // Sequences already drained stay rejected
    {
        ResultBuffer buffer;
        buffer.insert(0, "original");
        DrainResult run = buffer.drainContiguousFrom(0);
        assert(run.newCursor == 1);
        assert(buffer.floor() == 1);

        bool threw = false;
        try {
            buffer.insert(0, "reprocessed");
        } catch (const DuplicateSequence& e) {
            threw = true;
            assert(e.sequence() == 0);
        }
        assert(threw);
        assert(buffer.size() == 0);

        buffer.raiseFloor(5);
        threw = false;
        try {
            buffer.insert(3, "skipped");
        } catch (const DuplicateSequence&) {
            threw = true;
        }
        assert(threw);
        buffer.raiseFloor(2); // never lowers
        assert(buffer.floor() == 5);
        buffer.insert(5, "next");
        assert(buffer.contains(5));
    }
    std::cout << "[PASS] Re-insert below the drained cursor rejected." << std::endl;

    // A re-insert while a run is out for writing does not replace it
    {
        ResultBuffer buffer;
        buffer.insert(0, "a");
        buffer.insert(1, "b");
        DrainResult run = buffer.drainContiguousFrom(0);

        bool threw = false;
        try {
            buffer.insert(1, "impostor");
        } catch (const DuplicateSequence&) {
            threw = true;
        }
        assert(threw);

        buffer.restore(run.results);
        assert(buffer.floor() == 0);
        DrainResult again = buffer.drainContiguousFrom(0);
        assert(again.results.size() == 2);
        assert(again.results[1].text == "b");
    }
    std::cout << "[PASS] Restored originals win." << std::endl;

    // Concurrent inserts, with a concurrent drainer
    {
        ResultBuffer buffer;
        const int THREADS = 8;
        const int PER_THREAD = 250;
        const int TOTAL = THREADS * PER_THREAD;

        std::atomic<bool> producersDone{false};
        std::vector<TranscriptionResult> drained;
        std::int64_t cursor = 0;

        std::thread drainer([&]() {
            while (true) {
                bool finished = producersDone.load();
                DrainResult run = buffer.drainContiguousFrom(cursor);
                for (auto& r : run.results) {
                    drained.push_back(r);
                }
                cursor = run.newCursor;
                if (finished && run.empty()) break;
                std::this_thread::yield();
            }
        });

        std::vector<std::thread> producers;
        for (int t = 0; t < THREADS; ++t) {
            producers.emplace_back([&buffer, t]() {
                // Interleaved sequences so runs complete out of order
                for (int i = 0; i < PER_THREAD; ++i) {
                    int seq = i * THREADS + t;
                    buffer.insert(seq, std::to_string(seq));
                }
            });
        }
        for (auto& p : producers) p.join();
        producersDone = true;
        drainer.join();

        assert(static_cast<int>(drained.size()) == TOTAL);
        for (int i = 0; i < TOTAL; ++i) {
            assert(drained[i].sequence == i);
            assert(drained[i].text == std::to_string(i));
        }
        assert(cursor == TOTAL);
        assert(buffer.size() == 0);
    }
    std::cout << "[PASS] Concurrent inserts drained in order." << std::endl;

    std::cout << "[Test] Result Buffer Test completed." << std::endl;
    return 0;
}
