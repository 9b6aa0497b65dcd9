/**
 * @file FragmentStore.hpp
 * @brief File operations on fragments: reading audio and routing to processed/failed locations.
 */

#pragma once
#include <string>

namespace streamscribe::infrastructure {

/**
 * @class FragmentStore
 * @brief Reads fragment audio and moves finished fragments out of the input directory.
 *
 * Fragments are moved, never deleted. A name already taken at the destination
 * gets a suffix ("_failed", "_dup") and, if needed, a counter.
 */
class FragmentStore {
public:
    FragmentStore(const std::string& processedPath, const std::string& failedPath);

    /**
     * @brief Loads the complete file content.
     * @throws domain::TranscriptionError if the file is missing, unreadable or empty.
     */
    std::string readAudio(const std::string& path) const;

    /** @brief Moves a transcribed fragment to the processed directory. Returns the new path. */
    std::string moveToProcessed(const std::string& path) const;

    /** @brief Moves a failed fragment to the failed directory. Returns the new path. */
    std::string moveToFailed(const std::string& path) const;

    const std::string& processedPath() const { return m_processedPath; }
    const std::string& failedPath() const { return m_failedPath; }

private:
    std::string moveInto(const std::string& path, const std::string& directory, const std::string& collisionSuffix) const;

    std::string m_processedPath;
    std::string m_failedPath;
};

} // namespace streamscribe::infrastructure
