/**
 * @file FileSystemFragmentScanner.cpp
 * @brief Implementation of the FileSystemFragmentScanner.
 */

#include "infrastructure/FileSystemFragmentScanner.hpp"
#include "domain/PipelineErrors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

namespace streamscribe::infrastructure {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c){ return std::tolower(c); });
    return value;
}

} // namespace

FileSystemFragmentScanner::FileSystemFragmentScanner(const std::string& inputPath, std::vector<std::string> extensions)
    : m_inputPath(inputPath) {
    for (auto& ext : extensions) {
        if (!ext.empty() && ext[0] != '.') {
            ext.insert(ext.begin(), '.');
        }
        m_extensions.push_back(ToLower(ext));
    }
}

bool FileSystemFragmentScanner::isAccepted(const std::string& extension) const {
    if (m_extensions.empty()) {
        return true;
    }
    const std::string lowered = ToLower(extension);
    return std::find(m_extensions.begin(), m_extensions.end(), lowered) != m_extensions.end();
}

std::vector<domain::Fragment> FileSystemFragmentScanner::scan() const {
    std::vector<domain::Fragment> fragments;

    std::error_code ec;
    fs::directory_iterator it(m_inputPath, ec);
    if (ec) {
        throw domain::DispatchError("Cannot read fragment directory " + m_inputPath + ": " + ec.message());
    }

    try {
        for (const auto& entry : it) {
            std::error_code entryEc;
            if (!entry.is_regular_file(entryEc) || entryEc) {
                continue;
            }
            if (!isAccepted(entry.path().extension().string())) {
                continue;
            }

            domain::Fragment fragment;
            fragment.path = entry.path().string();
            fragment.filename = entry.path().filename().string();
            fragment.sequence = domain::ParseSequenceNumber(fragment.filename).value_or(-1);

            // The file may vanish between listing and stat (moved by a worker).
            auto ftime = fs::last_write_time(entry, entryEc);
            if (entryEc) {
                continue;
            }
            fragment.lastModified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now()
            );

            auto size = fs::file_size(entry, entryEc);
            fragment.sizeBytes = entryEc ? 0 : static_cast<long long>(size);

            fragments.push_back(fragment);
        }
    } catch (const fs::filesystem_error& e) {
        throw domain::DispatchError("Error while listing " + m_inputPath + ": " + e.what());
    }

    std::sort(fragments.begin(), fragments.end(), [](const domain::Fragment& a, const domain::Fragment& b) {
        if (a.lastModified != b.lastModified) {
            return a.lastModified < b.lastModified;
        }
        return a.filename < b.filename;
    });

    return fragments;
}

} // namespace streamscribe::infrastructure
