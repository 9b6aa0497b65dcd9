/**
 * @file TranscriptWriter.cpp
 * @brief Implementation of TranscriptWriter.
 */

#include "infrastructure/TranscriptWriter.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>

namespace streamscribe::infrastructure {

namespace fs = std::filesystem;

bool TranscriptWriter::writeAtomic(const std::string& filename, const std::string& content, std::string& error) const {
    fs::path finalPath = filename;

    // filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            error = "Error creating directories for " + finalPath.string() + ": " + ec.message();
            return false;
        }
    }

    // 2. Write to temp
    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            error = "Failed to open temp file: " + tempPath.string();
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            error = "Write failed during output: " + tempPath.string();
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    // 3. Atomic rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        error = "Rename failed: " + ec.message();
        std::error_code cleanupEc;
        fs::remove(tempPath, cleanupEc);
        return false;
    }
    return true;
}

} // namespace streamscribe::infrastructure
