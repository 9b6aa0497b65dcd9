/**
 * @file FragmentStore.cpp
 * @brief Implementation of FragmentStore.
 */

#include "infrastructure/FragmentStore.hpp"
#include "domain/PipelineErrors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace streamscribe::infrastructure {

namespace {

fs::path UniqueDestination(const fs::path& directory, const fs::path& filename, const std::string& suffix) {
    fs::path candidate = directory / filename;
    if (!fs::exists(candidate)) {
        return candidate;
    }

    const std::string stem = filename.stem().string();
    const std::string ext = filename.extension().string();
    candidate = directory / (stem + suffix + ext);
    for (int i = 2; fs::exists(candidate); ++i) {
        candidate = directory / (stem + suffix + "_" + std::to_string(i) + ext);
    }
    return candidate;
}

void MoveFile(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) {
        return;
    }
    if (ec != std::errc::cross_device_link) {
        throw std::runtime_error("rename " + from.string() + " -> " + to.string() + " failed: " + ec.message());
    }

    // Different volume: copy then remove the source.
    fs::copy_file(from, to, fs::copy_options::none);
    fs::remove(from);
}

} // namespace

FragmentStore::FragmentStore(const std::string& processedPath, const std::string& failedPath)
    : m_processedPath(processedPath), m_failedPath(failedPath) {}

std::string FragmentStore::readAudio(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw domain::TranscriptionError("Audio file not found or unreadable: " + path);
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw domain::TranscriptionError("Read failed: " + path);
    }

    std::string bytes = buffer.str();
    if (bytes.empty()) {
        throw domain::TranscriptionError("Audio file is empty: " + path);
    }
    return bytes;
}

std::string FragmentStore::moveToProcessed(const std::string& path) const {
    return moveInto(path, m_processedPath, "_dup");
}

std::string FragmentStore::moveToFailed(const std::string& path) const {
    return moveInto(path, m_failedPath, "_failed");
}

std::string FragmentStore::moveInto(const std::string& path, const std::string& directory, const std::string& collisionSuffix) const {
    fs::path source(path);
    fs::create_directories(directory);
    fs::path destination = UniqueDestination(directory, source.filename(), collisionSuffix);
    MoveFile(source, destination);
    return destination.string();
}

} // namespace streamscribe::infrastructure
