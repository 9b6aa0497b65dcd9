/**
 * @file MergeCoordinator.cpp
 * @brief Implementation of MergeCoordinator.
 */

#include "application/MergeCoordinator.hpp"
#include "domain/Fragment.hpp"
#include "domain/PipelineErrors.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace streamscribe::application {

namespace {

bool IsBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Resets the state to Idle however the tick ends.
struct IdleGuard {
    std::atomic<MergeState>& state;
    ~IdleGuard() { state = MergeState::Idle; }
};

} // namespace

MergeCoordinator::MergeCoordinator(ResultBuffer& buffer,
                                   std::shared_ptr<infrastructure::DiskSpaceProbe> diskProbe,
                                   MergeOptions options)
    : m_buffer(buffer),
      m_diskProbe(std::move(diskProbe)),
      m_options(std::move(options)),
      m_cursor(m_options.firstSequence) {
    m_buffer.raiseFloor(m_cursor);
    fs::create_directories(m_options.archiveDir);
}

std::optional<domain::ArchivedTranscript> MergeCoordinator::tick() {
    std::lock_guard<std::mutex> lock(m_mutex);
    IdleGuard guard{m_state};

    m_state = MergeState::Scanning;
    DrainResult run = m_buffer.drainContiguousFrom(m_cursor);
    if (run.empty()) {
        return std::nullopt;
    }

    m_state = MergeState::Merging;

    if (m_diskProbe) {
        try {
            m_diskProbe->ensureAvailable(m_options.archiveDir, m_options.diskThresholdBytes);
        } catch (const domain::DiskLowError&) {
            std::cerr << "[MergeCoordinator] Disk low, run requeued" << std::endl;
            m_buffer.restore(run.results);
            throw;
        }
    }

    domain::ArchivedTranscript archive;
    archive.start = run.results.front().sequence;
    archive.end = run.results.back().sequence;
    archive.fragmentCount = run.results.size();
    archive.path = (fs::path(m_options.archiveDir) / ArchiveFileName(archive.start, archive.end)).string();

    std::string error;
    if (!m_writer.writeAtomic(archive.path, JoinTexts(run.results), error)) {
        m_buffer.restore(run.results);
        throw domain::PipelineError("Archive write failed for " + archive.path + ": " + error);
    }

    archive.createdAt = std::chrono::system_clock::now();
    m_cursor = run.newCursor;
    m_archives.push_back(archive);
    m_archivedFragments += archive.fragmentCount;

    std::cout << "[MergeCoordinator] Merged " << archive.fragmentCount << " fragment(s) into " << archive.path << std::endl;
    return archive;
}

size_t MergeCoordinator::drainAll() {
    size_t written = 0;
    while (tick()) {
        ++written;
    }
    return written;
}

bool MergeCoordinator::skipGap() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_buffer.contains(m_cursor)) {
        return false;
    }
    std::cerr << "[MergeCoordinator] Skipping missing sequence " << m_cursor << " by operator request" << std::endl;
    ++m_cursor;
    m_buffer.raiseFloor(m_cursor);
    return true;
}

std::int64_t MergeCoordinator::cursor() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cursor;
}

std::vector<domain::ArchivedTranscript> MergeCoordinator::archives() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_archives;
}

size_t MergeCoordinator::archivedFragmentCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_archivedFragments;
}

std::string MergeCoordinator::ArchiveFileName(std::int64_t start, std::int64_t end) {
    return "full_" + domain::FormatSequence(start) + "_to_" + domain::FormatSequence(end) + ".txt";
}

std::string MergeCoordinator::JoinTexts(const std::vector<domain::TranscriptionResult>& results) {
    std::string merged;
    for (const auto& result : results) {
        if (IsBlank(result.text)) {
            continue;
        }
        if (!merged.empty()) {
            merged += '\n';
        }
        merged += result.text;
    }
    return merged;
}

const char* MergeCoordinator::StateToString(MergeState state) {
    switch (state) {
        case MergeState::Idle: return "idle";
        case MergeState::Scanning: return "scanning";
        case MergeState::Merging: return "merging";
    }
    return "idle";
}

} // namespace streamscribe::application
