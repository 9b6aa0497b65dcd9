/**
 * @file FragmentDispatcher.hpp
 * @brief Polls the fragment source and feeds new fragments to the worker pool.
 */

#pragma once
#include "application/WorkerPool.hpp"
#include "domain/Fragment.hpp"
#include "infrastructure/DiskSpaceProbe.hpp"
#include "infrastructure/FileSystemFragmentScanner.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace streamscribe::application {

/**
 * @struct DispatcherOptions
 * @brief Admission rules applied on each poll.
 */
struct DispatcherOptions {
    std::chrono::milliseconds settle{0};      ///< Skip files modified more recently than this.
    std::string diskCheckPath;                ///< Volume whose free space gates dispatch.
    std::uintmax_t diskThresholdBytes = 0;    ///< Zero disables the disk check.
};

/**
 * @class FragmentDispatcher
 * @brief Cooperative polling watcher with a per-instance seen-set.
 *
 * A file name is dispatched at most once during the lifetime of the
 * instance. Dispatch follows arrival order; sequence order is restored later
 * by the merge coordinator.
 */
class FragmentDispatcher {
public:
    FragmentDispatcher(std::unique_ptr<infrastructure::FileSystemFragmentScanner> scanner,
                       std::shared_ptr<infrastructure::DiskSpaceProbe> diskProbe,
                       WorkerPool& pool,
                       DispatcherOptions options);

    /**
     * @brief Inspects the source directory once and submits every new fragment.
     * @return The fragments submitted by this call.
     * @throws domain::DiskLowError while free space is below the threshold; nothing is dispatched.
     * @throws domain::DispatchError if the directory cannot be read.
     */
    std::vector<domain::Fragment> poll();

    /** @brief Refuses any further dispatch. */
    void stop();

    bool isStopped() const;
    bool isDiskLow() const;
    bool hasSeen(const std::string& filename) const;
    size_t dispatchedCount() const;

private:
    std::unique_ptr<infrastructure::FileSystemFragmentScanner> m_scanner;
    std::shared_ptr<infrastructure::DiskSpaceProbe> m_diskProbe;
    WorkerPool& m_pool;
    DispatcherOptions m_options;

    std::mutex m_pollMutex;           ///< One poll at a time.
    mutable std::mutex m_seenMutex;
    std::unordered_set<std::string> m_seen;
    std::unordered_set<std::string> m_rejected; ///< Unparsable names already warned about.
    std::atomic<size_t> m_dispatched{0};
    std::atomic<bool> m_stopped{false};
    std::atomic<bool> m_diskLow{false};
};

} // namespace streamscribe::application
