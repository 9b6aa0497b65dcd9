/**
 * @file FailureLedger.cpp
 * @brief Implementation of FailureLedger.
 */

#include "application/FailureLedger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace streamscribe::application {

namespace {

std::string ToIsoTime(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    localtime_r(&tt, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

} // namespace

FailureLedger::FailureLedger(std::string logPath) : m_logPath(std::move(logPath)) {}

void FailureLedger::record(std::int64_t sequence, const std::string& filename, const std::string& reason) {
    domain::FailureRecord rec;
    rec.sequence = sequence;
    rec.filename = filename;
    rec.reason = reason;
    rec.failedAt = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.push_back(rec);
    m_sequences.insert(sequence);
    appendToLog(rec);
}

void FailureLedger::recordDuplicate(std::int64_t sequence, const std::string& filename) {
    domain::FailureRecord rec;
    rec.sequence = sequence;
    rec.filename = filename;
    rec.reason = "duplicate sequence";
    rec.failedAt = std::chrono::system_clock::now();
    rec.duplicate = true;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.push_back(rec);
    ++m_duplicates;
    appendToLog(rec);
}

void FailureLedger::appendToLog(const domain::FailureRecord& rec) {
    if (m_logPath.empty()) {
        return;
    }

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path logPath(m_logPath);
    if (logPath.has_parent_path()) {
        fs::create_directories(logPath.parent_path(), ec);
    }

    std::ofstream out(logPath, std::ios::app);
    if (!out.is_open()) {
        std::cerr << "[FailureLedger] Cannot open " << m_logPath << std::endl;
        return;
    }
    out << ToIsoTime(rec.failedAt) << "\t" << rec.sequence << "\t" << rec.filename << "\t" << rec.reason << "\n";
}

bool FailureLedger::contains(std::int64_t sequence) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sequences.count(sequence) > 0;
}

std::vector<domain::FailureRecord> FailureLedger::records() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

size_t FailureLedger::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

size_t FailureLedger::duplicateCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_duplicates;
}

} // namespace streamscribe::application
