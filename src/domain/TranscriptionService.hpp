/**
 * @file TranscriptionService.hpp
 * @brief Interfaces for audio-to-text transcription backends.
 */

#pragma once

#include <memory>
#include <string>

namespace streamscribe::domain {

/**
 * @class TranscriptionService
 * @brief Abstract interface for recognizers that convert one audio fragment to text.
 *
 * Implementations must be safe to call from several worker threads at once,
 * either because they are stateless per call or because they serialize
 * access to the underlying model internally.
 */
class TranscriptionService {
public:
    virtual ~TranscriptionService() = default;

    /**
     * @brief Transcribes a complete audio file held in memory.
     * @param audioBytes Raw file content (WAV or any format the backend accepts).
     * @param sourceName Original file name, used for format detection and logs.
     * @return Recognized text, possibly empty.
     * @throws ModelUnavailable if the model cannot be loaded or reached.
     * @throws TranscriptionError if recognition fails for this input.
     */
    virtual std::string transcribe(const std::string& audioBytes, const std::string& sourceName) = 0;

    /** @brief Short backend label for logs ("whisper_cpp", "whisper_server", ...). */
    virtual std::string backendName() const = 0;
};

/**
 * @class ModelProvider
 * @brief Supplies ready-to-use transcribers, possibly reusing cached model instances.
 */
class ModelProvider {
public:
    virtual ~ModelProvider() = default;

    /**
     * @brief Returns the transcriber for the default model.
     * @throws ModelUnavailable when no transcriber can be produced.
     */
    virtual std::shared_ptr<TranscriptionService> acquire() = 0;
};

} // namespace streamscribe::domain
