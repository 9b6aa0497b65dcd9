/**
 * @file TranscriptionResult.hpp
 * @brief Value objects produced by transcription and consumed by the merge stage.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace streamscribe::domain {

/**
 * @struct TranscriptionResult
 * @brief Text recognized for one fragment. Immutable once inserted in the buffer.
 */
struct TranscriptionResult {
    std::int64_t sequence = -1;
    std::string text;
    std::chrono::system_clock::time_point producedAt;
};

/**
 * @struct ArchivedTranscript
 * @brief A merged transcript file covering the contiguous range [start, end].
 */
struct ArchivedTranscript {
    std::int64_t start = 0;
    std::int64_t end = 0;
    std::string path;
    size_t fragmentCount = 0;
    std::chrono::system_clock::time_point createdAt;
};

/**
 * @struct FailureRecord
 * @brief Why a fragment never reached the result buffer.
 */
struct FailureRecord {
    std::int64_t sequence = -1;
    std::string filename;
    std::string reason;
    std::chrono::system_clock::time_point failedAt;
    bool duplicate = false; ///< Rejected copy of a sequence that already has a result.
};

} // namespace streamscribe::domain
