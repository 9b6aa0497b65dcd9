/**
 * @file FileSystemFragmentScanner.hpp
 * @brief Scanner for audio fragments arriving in the source directory.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Fragment.hpp"

namespace streamscribe::infrastructure {

/**
 * @class FileSystemFragmentScanner
 * @brief Infrastructure adapter listing candidate fragment files in the input directory.
 */
class FileSystemFragmentScanner {
public:
    /**
     * @param inputPath Directory receiving fragments.
     * @param extensions Accepted extensions including the dot, compared case-insensitively.
     */
    FileSystemFragmentScanner(const std::string& inputPath, std::vector<std::string> extensions);

    /**
     * @brief Lists regular files with an accepted extension, oldest first.
     *
     * Fragments whose name carries no sequence number are returned with
     * sequence -1; the caller decides how to report them.
     * @throws domain::DispatchError if the directory cannot be read.
     */
    std::vector<domain::Fragment> scan() const;

    const std::string& inputPath() const { return m_inputPath; }

private:
    bool isAccepted(const std::string& extension) const;

    std::string m_inputPath;
    std::vector<std::string> m_extensions;
};

} // namespace streamscribe::infrastructure
