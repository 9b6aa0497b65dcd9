#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <vector>

#include "application/FragmentDispatcher.hpp"
#include "application/WorkerPool.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/DiskSpaceProbe.hpp"
#include "infrastructure/FileSystemFragmentScanner.hpp"

using namespace streamscribe::application;
using namespace streamscribe::domain;
using streamscribe::infrastructure::DiskSpaceProbe;
using streamscribe::infrastructure::FileSystemFragmentScanner;
namespace fs = std::filesystem;

class FakeDiskProbe : public DiskSpaceProbe {
public:
    std::uintmax_t availableBytes(const std::string&) const override { return available.load(); }
    std::atomic<std::uintmax_t> available{1ull << 40};
};

// Records every fragment the pool hands out
struct Recorder {
    std::mutex mutex;
    std::vector<std::string> names;

    void add(const Fragment& f) {
        std::lock_guard<std::mutex> lock(mutex);
        names.push_back(f.filename);
    }
    size_t count(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        return std::count(names.begin(), names.end(), name);
    }
    size_t size() {
        std::lock_guard<std::mutex> lock(mutex);
        return names.size();
    }
};

static void Touch(const fs::path& path, const std::string& content = "RIFF") {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

static void Age(const fs::path& path) {
    fs::last_write_time(path, fs::file_time_type::clock::now() - std::chrono::minutes(5));
}

int main() {
    std::cout << "[Test] Starting Fragment Dispatcher Test..." << std::endl;

    const fs::path testRoot = "test_dispatch_root";
    fs::remove_all(testRoot);

    // Seen-set, extension filter, unparsable names
    {
        const fs::path input = testRoot / "basic";
        fs::create_directories(input);
        Touch(input / "chunk_000.wav");
        Touch(input / "chunk_001.WAV");
        Touch(input / "notes.txt");
        Touch(input / "intro.wav");

        Recorder recorder;
        WorkerPool pool(2, 8, [&](Fragment& f) { recorder.add(f); });
        FragmentDispatcher dispatcher(
            std::make_unique<FileSystemFragmentScanner>(input.string(), std::vector<std::string>{"wav"}),
            nullptr, pool, DispatcherOptions{});

        auto first = dispatcher.poll();
        assert(first.size() == 2);
        assert(dispatcher.hasSeen("chunk_000.wav"));
        assert(dispatcher.hasSeen("chunk_001.WAV"));
        assert(!dispatcher.hasSeen("intro.wav"));
        assert(!dispatcher.hasSeen("notes.txt"));

        // Files are still in the directory: nothing new
        auto second = dispatcher.poll();
        assert(second.empty());

        Touch(input / "chunk_002.wav");
        auto third = dispatcher.poll();
        assert(third.size() == 1);
        assert(third[0].sequence == 2);
        assert(third[0].status == FragmentStatus::Pending);

        pool.waitIdle();
        assert(recorder.size() == 3);
        assert(recorder.count("chunk_000.wav") == 1);
        assert(recorder.count("intro.wav") == 0);
        assert(dispatcher.dispatchedCount() == 3);
        pool.shutdown();
    }
    std::cout << "[PASS] Each file dispatched once." << std::endl;

    // Files still being written wait for the settle time
    {
        const fs::path input = testRoot / "settle";
        fs::create_directories(input);
        Touch(input / "chunk_010.wav");

        Recorder recorder;
        WorkerPool pool(1, 4, [&](Fragment& f) { recorder.add(f); });
        DispatcherOptions options;
        options.settle = std::chrono::seconds(60);
        FragmentDispatcher dispatcher(
            std::make_unique<FileSystemFragmentScanner>(input.string(), std::vector<std::string>{".wav"}),
            nullptr, pool, options);

        auto early = dispatcher.poll();
        assert(early.empty());
        assert(!dispatcher.hasSeen("chunk_010.wav"));

        Age(input / "chunk_010.wav");
        auto settled = dispatcher.poll();
        assert(settled.size() == 1);
        pool.shutdown();
    }
    std::cout << "[PASS] Unsettled files wait." << std::endl;

    // Unreadable source
    {
        WorkerPool pool(1, 1, [](Fragment&) {});
        FragmentDispatcher dispatcher(
            std::make_unique<FileSystemFragmentScanner>((testRoot / "missing").string(), std::vector<std::string>{".wav"}),
            nullptr, pool, DispatcherOptions{});
        bool threw = false;
        try {
            dispatcher.poll();
        } catch (const DispatchError&) {
            threw = true;
        }
        assert(threw);
        pool.shutdown();
    }
    std::cout << "[PASS] Missing directory raises DispatchError." << std::endl;

    // Low disk pauses dispatch; running jobs still finish
    {
        const fs::path input = testRoot / "disk";
        fs::create_directories(input);
        Touch(input / "chunk_000.wav");

        auto probe = std::make_shared<FakeDiskProbe>();
        std::mutex gate;
        gate.lock();
        std::atomic<int> finished{0};
        WorkerPool pool(1, 4, [&](Fragment&) {
            std::lock_guard<std::mutex> wait(gate);
            ++finished;
        });

        DispatcherOptions options;
        options.diskThresholdBytes = 1000;
        FragmentDispatcher dispatcher(
            std::make_unique<FileSystemFragmentScanner>(input.string(), std::vector<std::string>{".wav"}),
            probe, pool, options);

        auto running = dispatcher.poll();
        assert(running.size() == 1);

        probe->available = 10;
        Touch(input / "chunk_001.wav");
        bool threw = false;
        try {
            dispatcher.poll();
        } catch (const DiskLowError&) {
            threw = true;
        }
        assert(threw);
        assert(dispatcher.isDiskLow());
        assert(!dispatcher.hasSeen("chunk_001.wav"));

        // In-flight job completes while paused
        gate.unlock();
        pool.waitIdle();
        assert(finished == 1);

        probe->available = 1ull << 30;
        auto resumed = dispatcher.poll();
        assert(resumed.size() == 1);
        assert(resumed[0].filename == "chunk_001.wav");
        assert(!dispatcher.isDiskLow());
        pool.waitIdle();
        assert(finished == 2);
        pool.shutdown();
    }
    std::cout << "[PASS] Low disk refuses new dispatch only." << std::endl;

    // Stopped dispatcher and shut-down pool
    {
        const fs::path input = testRoot / "stop";
        fs::create_directories(input);
        Touch(input / "chunk_000.wav");

        WorkerPool pool(1, 1, [](Fragment&) {});
        FragmentDispatcher dispatcher(
            std::make_unique<FileSystemFragmentScanner>(input.string(), std::vector<std::string>{".wav"}),
            nullptr, pool, DispatcherOptions{});
        pool.shutdown();

        // Pool refuses the fragment: it stays unseen for a later run
        auto none = dispatcher.poll();
        assert(none.empty());
        assert(dispatcher.isStopped());
        assert(!dispatcher.hasSeen("chunk_000.wav"));
        assert(dispatcher.dispatchedCount() == 0);
    }
    std::cout << "[PASS] Shutdown refuses dispatch." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Fragment Dispatcher Test completed." << std::endl;
    return 0;
}
