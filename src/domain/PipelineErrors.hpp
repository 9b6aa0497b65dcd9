/**
 * @file PipelineErrors.hpp
 * @brief Error taxonomy shared by the dispatch, transcription and merge stages.
 */

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace streamscribe::domain {

/**
 * @class PipelineError
 * @brief Base class for every error raised by the transcription pipeline.
 */
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& msg) : std::runtime_error(msg) {}
};

/** @brief The fragment source directory could not be read. Retried on the next poll. */
class DispatchError : public PipelineError {
public:
    explicit DispatchError(const std::string& msg) : PipelineError(msg) {}
};

/** @brief A sequence number was inserted twice into the result buffer. */
class DuplicateSequence : public PipelineError {
public:
    explicit DuplicateSequence(std::int64_t sequence)
        : PipelineError("Duplicate sequence number: " + std::to_string(sequence)), m_sequence(sequence) {}

    std::int64_t sequence() const { return m_sequence; }

private:
    std::int64_t m_sequence;
};

/** @brief The recognizer failed on a fragment, or the fragment could not be read. */
class TranscriptionError : public PipelineError {
public:
    explicit TranscriptionError(const std::string& msg) : PipelineError(msg) {}
};

/** @brief No transcriber could be produced (missing model file, unknown backend, server down). */
class ModelUnavailable : public PipelineError {
public:
    explicit ModelUnavailable(const std::string& msg) : PipelineError(msg) {}
};

/** @brief Free disk space dropped below the configured threshold. */
class DiskLowError : public PipelineError {
public:
    DiskLowError(const std::string& path, std::uintmax_t availableBytes, std::uintmax_t thresholdBytes)
        : PipelineError("Disk low on " + path + ": " + std::to_string(availableBytes) +
                        " bytes free, threshold " + std::to_string(thresholdBytes)),
          m_availableBytes(availableBytes),
          m_thresholdBytes(thresholdBytes) {}

    std::uintmax_t availableBytes() const { return m_availableBytes; }
    std::uintmax_t thresholdBytes() const { return m_thresholdBytes; }

private:
    std::uintmax_t m_availableBytes;
    std::uintmax_t m_thresholdBytes;
};

/** @brief Configuration file missing, malformed or out of range. */
class ConfigError : public PipelineError {
public:
    explicit ConfigError(const std::string& msg) : PipelineError(msg) {}
};

} // namespace streamscribe::domain
