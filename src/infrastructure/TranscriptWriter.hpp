/**
 * @file TranscriptWriter.hpp
 * @brief Atomic text file writes for archived transcripts.
 */

#pragma once
#include <string>

namespace streamscribe::infrastructure {

/**
 * @class TranscriptWriter
 * @brief Writes a file through a temporary sibling and a rename, so readers
 *        never observe a partially written transcript.
 */
class TranscriptWriter {
public:
    /**
     * @brief Writes @p content to @p filename, creating parent directories.
     * @param error Populated on failure.
     * @return True if the final file is in place.
     */
    bool writeAtomic(const std::string& filename, const std::string& content, std::string& error) const;
};

} // namespace streamscribe::infrastructure
