/**
 * @file ResultBuffer.cpp
 * @brief Implementation of ResultBuffer.
 */

#include "application/ResultBuffer.hpp"
#include "domain/PipelineErrors.hpp"
#include <algorithm>
#include <chrono>

namespace streamscribe::application {

void ResultBuffer::insert(std::int64_t sequence, const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (sequence < m_floor || m_entries.count(sequence) > 0) {
        throw domain::DuplicateSequence(sequence);
    }

    domain::TranscriptionResult result;
    result.sequence = sequence;
    result.text = text;
    result.producedAt = std::chrono::system_clock::now();
    m_entries.emplace(sequence, std::move(result));
}

DrainResult ResultBuffer::drainContiguousFrom(std::int64_t cursor) {
    std::lock_guard<std::mutex> lock(m_mutex);

    DrainResult drained;
    drained.newCursor = cursor;

    // Ordered map: walk forward while keys match the expected next sequence.
    auto it = m_entries.find(cursor);
    while (it != m_entries.end() && it->first == drained.newCursor) {
        drained.results.push_back(std::move(it->second));
        it = m_entries.erase(it);
        ++drained.newCursor;
    }
    m_floor = std::max(m_floor, drained.newCursor);
    return drained;
}

void ResultBuffer::restore(const std::vector<domain::TranscriptionResult>& results) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& result : results) {
        m_entries.insert_or_assign(result.sequence, result);
        m_floor = std::min(m_floor, result.sequence);
    }
}

void ResultBuffer::raiseFloor(std::int64_t sequence) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_floor = std::max(m_floor, sequence);
}

std::int64_t ResultBuffer::floor() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_floor;
}

size_t ResultBuffer::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

bool ResultBuffer::contains(std::int64_t sequence) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.count(sequence) > 0;
}

std::vector<std::int64_t> ResultBuffer::sequences() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::int64_t> out;
    out.reserve(m_entries.size());
    for (const auto& [sequence, result] : m_entries) {
        (void)result;
        out.push_back(sequence);
    }
    return out;
}

} // namespace streamscribe::application
