/**
 * @file TranscriptionPipeline.cpp
 * @brief Implementation of TranscriptionPipeline.
 */

#include "application/TranscriptionPipeline.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/FileSystemFragmentScanner.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace streamscribe::application {

namespace {

PipelineConfig PrepareDirectories(PipelineConfig config) {
    if (config.processedDir.empty()) {
        config.processedDir = (fs::path(config.archiveDir) / "originals").string();
    }
    for (const auto& dir : {config.inputDir, config.archiveDir, config.processedDir, config.failedDir}) {
        fs::create_directories(dir);
    }
    return config;
}

} // namespace

TranscriptionPipeline::TranscriptionPipeline(PipelineConfig config,
                                             std::shared_ptr<domain::ModelProvider> provider,
                                             std::shared_ptr<infrastructure::DiskSpaceProbe> diskProbe)
    : m_config(PrepareDirectories(std::move(config))),
      m_diskProbe(diskProbe ? std::move(diskProbe) : std::make_shared<infrastructure::DiskSpaceProbe>()),
      m_failures((fs::path(m_config.failedDir) / "failures.log").string()),
      m_store(m_config.processedDir, m_config.failedDir),
      m_job(std::move(provider), m_buffer, m_failures, m_store) {
    m_pool = std::make_unique<WorkerPool>(m_config.concurrency, m_config.queueCapacity,
                                          [this](domain::Fragment& fragment) { handleFragment(fragment); });

    DispatcherOptions dispatchOptions;
    dispatchOptions.settle = std::chrono::milliseconds(m_config.settleMs);
    dispatchOptions.diskCheckPath = m_config.archiveDir;
    dispatchOptions.diskThresholdBytes = m_config.diskThresholdBytes();
    m_dispatcher = std::make_unique<FragmentDispatcher>(
        std::make_unique<infrastructure::FileSystemFragmentScanner>(m_config.inputDir, m_config.audioExtensions),
        m_diskProbe, *m_pool, dispatchOptions);

    MergeOptions mergeOptions;
    mergeOptions.archiveDir = m_config.archiveDir;
    mergeOptions.firstSequence = m_config.firstSequence;
    mergeOptions.diskThresholdBytes = m_config.diskThresholdBytes();
    m_merger = std::make_unique<MergeCoordinator>(m_buffer, m_diskProbe, mergeOptions);
}

TranscriptionPipeline::~TranscriptionPipeline() {
    stop();
}

void TranscriptionPipeline::start() {
    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        return;
    }
    m_watcherThread = std::thread(&TranscriptionPipeline::watcherLoop, this);
    m_mergeThread = std::thread(&TranscriptionPipeline::mergeLoop, this);
    std::cout << "[TranscriptionPipeline] Started: " << m_pool->workerCount() << " worker(s), watching "
              << m_config.inputDir << std::endl;
}

void TranscriptionPipeline::stop() {
    bool expected = true;
    if (!m_running.compare_exchange_strong(expected, false)) {
        // Never started or already stopped; still make sure workers are joined.
        m_dispatcher->stop();
        m_pool->shutdown();
        return;
    }

    // A poll blocked in submit() finishes its current fragment and then sees the flag.
    m_dispatcher->stop();
    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
    }
    m_wake.notify_all();

    if (m_watcherThread.joinable()) {
        m_watcherThread.join();
    }
    m_pool->shutdown();

    if (m_mergeThread.joinable()) {
        m_mergeThread.join();
    }

    // Final merge of everything the workers finished.
    try {
        m_merger->drainAll();
    } catch (const std::exception& e) {
        std::cerr << "[TranscriptionPipeline] Final merge failed: " << e.what() << std::endl;
    }

    auto s = stats();
    std::cout << "[TranscriptionPipeline] Stopped. dispatched=" << s.dispatched << " succeeded=" << s.succeeded
              << " failed=" << s.failed << " buffered=" << s.buffered << " archived=" << s.archivedFragments
              << " cursor=" << s.cursor << std::endl;
    if (s.buffered > 0) {
        std::cerr << "[TranscriptionPipeline] " << s.buffered << " result(s) stay unmerged behind a gap at sequence "
                  << s.cursor << std::endl;
    }
}

PipelineStats TranscriptionPipeline::stats() const {
    PipelineStats s;
    s.dispatched = m_dispatcher->dispatchedCount();
    s.succeeded = m_succeeded.load();
    s.failed = m_failed.load();
    s.buffered = m_buffer.size();
    s.archivedFragments = m_merger->archivedFragmentCount();
    s.archives = m_merger->archives().size();
    s.queued = m_pool->queued();
    s.inFlight = m_pool->inFlight();
    s.cursor = m_merger->cursor();
    s.diskLow = m_dispatcher->isDiskLow();
    return s;
}

void TranscriptionPipeline::handleFragment(domain::Fragment& fragment) {
    JobOutcome outcome = m_job.run(fragment);
    if (outcome.succeeded()) {
        ++m_succeeded;
    } else {
        ++m_failed;
    }
}

bool TranscriptionPipeline::waitFor(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(m_wakeMutex);
    return !m_wake.wait_for(lock, interval, [this] { return !m_running.load(); });
}

void TranscriptionPipeline::watcherLoop() {
    const auto interval = std::chrono::milliseconds(std::max(1, m_config.pollIntervalMs));
    do {
        try {
            m_dispatcher->poll();
        } catch (const domain::DiskLowError&) {
            // The dispatcher reports the transition; poll again next tick.
        } catch (const domain::DispatchError& e) {
            std::cerr << "[TranscriptionPipeline] Watcher error: " << e.what() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[TranscriptionPipeline] Unexpected watcher error: " << e.what() << std::endl;
        }
    } while (waitFor(interval));
}

void TranscriptionPipeline::mergeLoop() {
    const auto interval = std::chrono::milliseconds(std::max(1, m_config.mergeIntervalSec) * 1000);
    while (waitFor(interval)) {
        try {
            m_merger->drainAll();
        } catch (const std::exception& e) {
            std::cerr << "[TranscriptionPipeline] Merge error: " << e.what() << std::endl;
        }
    }
}

} // namespace streamscribe::application
