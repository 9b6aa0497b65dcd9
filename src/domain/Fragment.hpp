/**
 * @file Fragment.hpp
 * @brief Domain entity representing one audio fragment in the ingestion pipeline.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace streamscribe::domain {

/**
 * @enum FragmentStatus
 * @brief Lifecycle of a fragment from first observation to its final location.
 */
enum class FragmentStatus {
    Pending,
    InProgress,
    Succeeded,
    Failed
};

/**
 * @class Fragment
 * @brief Entity representing an audio file detected in the fragment source directory.
 */
class Fragment {
public:
    std::int64_t sequence;         ///< Ordering key parsed from the file name.
    std::string path;              ///< Full path in the source directory.
    std::string filename;          ///< Basename of the file.
    std::chrono::system_clock::time_point arrivedAt;
    std::chrono::system_clock::time_point lastModified;
    long long sizeBytes;
    FragmentStatus status;

    Fragment() : sequence(-1), sizeBytes(0), status(FragmentStatus::Pending) {}

    static const char* StatusToString(FragmentStatus s) {
        switch (s) {
            case FragmentStatus::Pending: return "pending";
            case FragmentStatus::InProgress: return "in-progress";
            case FragmentStatus::Succeeded: return "succeeded";
            case FragmentStatus::Failed: return "failed";
        }
        return "pending";
    }
};

/**
 * @brief Extracts the sequence number encoded in a fragment file name.
 *
 * The trailing digit run of the stem wins ("rec_2025_045.wav" -> 45); when the
 * stem does not end in digits the first digit run is used. Names without any
 * digit yield nullopt.
 */
std::optional<std::int64_t> ParseSequenceNumber(const std::string& filename);

/** @brief Formats a sequence number zero-padded to at least three digits. */
std::string FormatSequence(std::int64_t sequence);

} // namespace streamscribe::domain
