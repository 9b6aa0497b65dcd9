/**
 * @file PipelineConfig.hpp
 * @brief Runtime settings consumed by the transcription pipeline.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace streamscribe::application {

/**
 * @struct PipelineConfig
 * @brief Directories, concurrency and timing of one pipeline instance.
 */
struct PipelineConfig {
    std::string inputDir = "input";
    std::string archiveDir = "archive";
    std::string processedDir = "archive/originals";
    std::string failedDir = "failed";

    double diskThresholdGb = 1.0;   ///< Dispatch and merge pause below this much free space.

    size_t concurrency = 4;         ///< Worker threads.
    size_t queueCapacity = 16;      ///< Bounded work queue size.
    int mergeIntervalSec = 10;
    int pollIntervalMs = 500;
    int settleMs = 0;               ///< Minimum file age before a fragment is claimed.
    std::int64_t firstSequence = 0; ///< Initial merge cursor.
    std::vector<std::string> audioExtensions{".wav"};

    std::uintmax_t diskThresholdBytes() const {
        if (diskThresholdGb <= 0.0) {
            return 0;
        }
        return static_cast<std::uintmax_t>(diskThresholdGb * 1024.0 * 1024.0 * 1024.0);
    }
};

} // namespace streamscribe::application
