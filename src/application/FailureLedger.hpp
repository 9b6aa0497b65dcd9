/**
 * @file FailureLedger.hpp
 * @brief Record of fragments whose transcription failed.
 */

#pragma once
#include "domain/TranscriptionResult.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace streamscribe::application {

/**
 * @class FailureLedger
 * @brief Thread-safe list of failed fragments, mirrored to an append-only log file.
 *
 * Every dispatched sequence ends up either merged, buffered or here.
 */
class FailureLedger {
public:
    /**
     * @param logPath File receiving one tab-separated line per failure. Empty
     *        disables the file mirror.
     */
    explicit FailureLedger(std::string logPath = "");

    void record(std::int64_t sequence, const std::string& filename, const std::string& reason);

    /**
     * @brief Logs a rejected duplicate. The sequence itself is not a gap, so
     *        contains() stays false for it.
     */
    void recordDuplicate(std::int64_t sequence, const std::string& filename);

    /** @brief True if @p sequence failed and is missing from the transcript. */
    bool contains(std::int64_t sequence) const;
    size_t duplicateCount() const;
    std::vector<domain::FailureRecord> records() const;
    size_t size() const;

private:
    void appendToLog(const domain::FailureRecord& rec);

    std::string m_logPath;
    mutable std::mutex m_mutex;
    std::vector<domain::FailureRecord> m_records;
    std::unordered_set<std::int64_t> m_sequences;
    size_t m_duplicates = 0;
};

} // namespace streamscribe::application
