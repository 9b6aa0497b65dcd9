/**
 * @file ResultBuffer.hpp
 * @brief Thread-safe holding area for transcribed fragments awaiting an ordered merge.
 */

#pragma once
#include "domain/TranscriptionResult.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace streamscribe::application {

/**
 * @struct DrainResult
 * @brief A contiguous run removed from the buffer and the cursor that follows it.
 */
struct DrainResult {
    std::vector<domain::TranscriptionResult> results; ///< Ascending by sequence.
    std::int64_t newCursor = 0;

    bool empty() const { return results.empty(); }
};

/**
 * @class ResultBuffer
 * @brief Maps sequence numbers to transcription results.
 *
 * A single mutex guards the map: every insert and every drain sees one
 * consistent view, and entries only leave as a contiguous prefix.
 *
 * Sequences below the floor are already merged (or were never expected),
 * so inserting one is treated as a duplicate as well.
 */
class ResultBuffer {
public:
    ResultBuffer() = default;
    ResultBuffer(const ResultBuffer&) = delete;
    ResultBuffer& operator=(const ResultBuffer&) = delete;

    /**
     * @brief Stores the text recognized for a fragment.
     * @throws domain::DuplicateSequence if @p sequence is already buffered or
     *         lies below the floor. The original entry is kept untouched.
     */
    void insert(std::int64_t sequence, const std::string& text);

    /**
     * @brief Removes the maximal gap-free run starting at @p cursor.
     * @return The run in ascending order and cursor + run length. When
     *         @p cursor itself is missing the run is empty and the cursor unchanged.
     *
     * The floor is raised to the returned cursor.
     */
    DrainResult drainContiguousFrom(std::int64_t cursor);

    /**
     * @brief Puts back a previously drained run, e.g. when writing it failed.
     * The floor drops back to the start of the run and the drained values
     * replace anything stored under the same sequences.
     */
    void restore(const std::vector<domain::TranscriptionResult>& results);

    /** @brief Rejects every later insert below @p sequence. Never lowers the floor. */
    void raiseFloor(std::int64_t sequence);
    std::int64_t floor() const;

    size_t size() const;
    bool contains(std::int64_t sequence) const;

    /** @brief Ascending snapshot of the buffered sequence numbers. */
    std::vector<std::int64_t> sequences() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::int64_t, domain::TranscriptionResult> m_entries;
    std::int64_t m_floor = 0;
};

} // namespace streamscribe::application
