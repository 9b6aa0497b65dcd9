/**
 * @file FragmentDispatcher.cpp
 * @brief Implementation of FragmentDispatcher.
 */

#include "application/FragmentDispatcher.hpp"
#include "domain/PipelineErrors.hpp"
#include <iostream>

namespace streamscribe::application {

FragmentDispatcher::FragmentDispatcher(std::unique_ptr<infrastructure::FileSystemFragmentScanner> scanner,
                                       std::shared_ptr<infrastructure::DiskSpaceProbe> diskProbe,
                                       WorkerPool& pool,
                                       DispatcherOptions options)
    : m_scanner(std::move(scanner)),
      m_diskProbe(std::move(diskProbe)),
      m_pool(pool),
      m_options(std::move(options)) {
    if (m_options.diskCheckPath.empty()) {
        m_options.diskCheckPath = m_scanner->inputPath();
    }
}

std::vector<domain::Fragment> FragmentDispatcher::poll() {
    std::vector<domain::Fragment> dispatched;

    // submit() may block below under backpressure; state getters stay usable.
    std::lock_guard<std::mutex> pollLock(m_pollMutex);
    if (m_stopped) {
        return dispatched;
    }

    if (m_diskProbe) {
        try {
            m_diskProbe->ensureAvailable(m_options.diskCheckPath, m_options.diskThresholdBytes);
        } catch (const domain::DiskLowError& e) {
            if (!m_diskLow) {
                std::cerr << "[FragmentDispatcher] Dispatch paused: " << e.what() << std::endl;
            }
            m_diskLow = true;
            throw;
        }
        if (m_diskLow) {
            std::cout << "[FragmentDispatcher] Disk space recovered, dispatch resumed" << std::endl;
            m_diskLow = false;
        }
    }

    auto candidates = m_scanner->scan();
    const auto now = std::chrono::system_clock::now();

    for (auto& fragment : candidates) {
        if (m_stopped) {
            break;
        }
        if (hasSeen(fragment.filename)) {
            continue;
        }

        if (fragment.sequence < 0) {
            if (m_rejected.insert(fragment.filename).second) {
                std::cerr << "[FragmentDispatcher] WARNING: no sequence number in '" << fragment.filename
                          << "', skipping" << std::endl;
            }
            continue;
        }

        if (m_options.settle.count() > 0 && now - fragment.lastModified < m_options.settle) {
            continue; // Still being written; next poll.
        }

        fragment.arrivedAt = now;
        fragment.status = domain::FragmentStatus::Pending;
        {
            std::lock_guard<std::mutex> lock(m_seenMutex);
            m_seen.insert(fragment.filename);
        }

        if (!m_pool.submit(fragment)) {
            // Pool is shutting down: leave the file for a later run.
            std::lock_guard<std::mutex> lock(m_seenMutex);
            m_seen.erase(fragment.filename);
            m_stopped = true;
            break;
        }
        ++m_dispatched;
        dispatched.push_back(fragment);
    }

    if (!dispatched.empty()) {
        std::cout << "[FragmentDispatcher] Dispatched " << dispatched.size() << " fragment(s)" << std::endl;
    }
    return dispatched;
}

void FragmentDispatcher::stop() {
    m_stopped = true;
}

bool FragmentDispatcher::isStopped() const {
    return m_stopped.load();
}

bool FragmentDispatcher::isDiskLow() const {
    return m_diskLow.load();
}

bool FragmentDispatcher::hasSeen(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(m_seenMutex);
    return m_seen.count(filename) > 0;
}

size_t FragmentDispatcher::dispatchedCount() const {
    return m_dispatched.load();
}

} // namespace streamscribe::application
