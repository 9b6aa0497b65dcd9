/**
 * @file TranscriptionPipeline.hpp
 * @brief Wires dispatch, transcription and merge together and runs their loops.
 */

#pragma once
#include "application/FailureLedger.hpp"
#include "application/FragmentDispatcher.hpp"
#include "application/MergeCoordinator.hpp"
#include "application/PipelineConfig.hpp"
#include "application/ResultBuffer.hpp"
#include "application/TranscriptionJob.hpp"
#include "application/WorkerPool.hpp"
#include "domain/TranscriptionService.hpp"
#include "infrastructure/DiskSpaceProbe.hpp"
#include "infrastructure/FragmentStore.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace streamscribe::application {

/**
 * @struct PipelineStats
 * @brief Counters for status output.
 *
 * dispatched == succeeded + failed + running; the succeeded fragments are
 * either still buffered or already archived.
 */
struct PipelineStats {
    size_t dispatched = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t buffered = 0;
    size_t archivedFragments = 0;
    size_t archives = 0;
    size_t queued = 0;
    size_t inFlight = 0;
    std::int64_t cursor = 0;
    bool diskLow = false;
};

/**
 * @class TranscriptionPipeline
 * @brief Owns every component of one pipeline instance.
 *
 * start() launches the watcher and merge loops next to the worker threads.
 * stop() stops dispatch, lets queued and running jobs finish, runs a final
 * merge and joins the loops.
 */
class TranscriptionPipeline {
public:
    TranscriptionPipeline(PipelineConfig config,
                          std::shared_ptr<domain::ModelProvider> provider,
                          std::shared_ptr<infrastructure::DiskSpaceProbe> diskProbe = nullptr);
    ~TranscriptionPipeline();

    TranscriptionPipeline(const TranscriptionPipeline&) = delete;
    TranscriptionPipeline& operator=(const TranscriptionPipeline&) = delete;

    void start();
    void stop();
    bool isRunning() const { return m_running.load(); }

    PipelineStats stats() const;

    ResultBuffer& buffer() { return m_buffer; }
    FailureLedger& failures() { return m_failures; }
    WorkerPool& pool() { return *m_pool; }
    FragmentDispatcher& dispatcher() { return *m_dispatcher; }
    MergeCoordinator& merger() { return *m_merger; }
    const PipelineConfig& config() const { return m_config; }

private:
    void watcherLoop();
    void mergeLoop();
    void handleFragment(domain::Fragment& fragment);

    /** @brief Sleeps for @p interval or until stop() is called. Returns false when stopping. */
    bool waitFor(std::chrono::milliseconds interval);

    PipelineConfig m_config;
    std::shared_ptr<infrastructure::DiskSpaceProbe> m_diskProbe;

    ResultBuffer m_buffer;
    FailureLedger m_failures;
    infrastructure::FragmentStore m_store;
    TranscriptionJob m_job;
    std::unique_ptr<WorkerPool> m_pool;
    std::unique_ptr<FragmentDispatcher> m_dispatcher;
    std::unique_ptr<MergeCoordinator> m_merger;

    std::atomic<size_t> m_succeeded{0};
    std::atomic<size_t> m_failed{0};

    std::atomic<bool> m_running{false};
    std::mutex m_wakeMutex;
    std::condition_variable m_wake;
    std::thread m_watcherThread;
    std::thread m_mergeThread;
};

} // namespace streamscribe::application
