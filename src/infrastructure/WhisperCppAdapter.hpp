#pragma once

#include "domain/TranscriptionService.hpp"
#include <mutex>
#include <string>

// Forward declaration to keep whisper.h out of the header.
struct whisper_context;

namespace streamscribe::infrastructure {

/**
 * @class WhisperCppAdapter
 * @brief In-process whisper.cpp recognizer.
 *
 * One whisper_context is shared by every worker. The context is not safe for
 * parallel inference, so transcribe() serializes on m_mutex; audio decoding
 * happens before the lock is taken.
 */
class WhisperCppAdapter : public domain::TranscriptionService {
public:
    WhisperCppAdapter(const std::string& modelPath, const std::string& language, int threads);
    ~WhisperCppAdapter() override;

    std::string transcribe(const std::string& audioBytes, const std::string& sourceName) override;
    std::string backendName() const override { return "whisper_cpp"; }

private:
    std::string m_modelPath;
    std::string m_language;
    int m_threads;

    whisper_context* m_ctx = nullptr;
    std::mutex m_mutex;
    bool m_modelLoaded = false;

    bool loadModel(std::string& errorMsg);
};

} // namespace streamscribe::infrastructure
