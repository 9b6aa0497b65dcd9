/**
 * @file WhisperServerAdapter.hpp
 * @brief Recognizer backed by a remote whisper.cpp server (/inference endpoint).
 */

#pragma once

#include "domain/TranscriptionService.hpp"
#include <string>

namespace streamscribe::infrastructure {

class WhisperServerAdapter : public domain::TranscriptionService {
public:
    WhisperServerAdapter(const std::string& host, int port,
                         const std::string& inferencePath = "/inference",
                         int timeoutSec = 30,
                         const std::string& language = "");

    /**
     * @brief Uploads the fragment as multipart "file" and returns the "text" field.
     * @throws domain::ModelUnavailable if the server cannot be reached.
     * @throws domain::TranscriptionError on a non-200 reply or an unexpected body.
     */
    std::string transcribe(const std::string& audioBytes, const std::string& sourceName) override;
    std::string backendName() const override { return "whisper_server"; }

    /** @brief Extracts the transcript from a server JSON reply. */
    static std::string ParseInferenceResponse(const std::string& body);

private:
    std::string m_host;
    int m_port;
    std::string m_inferencePath;
    int m_timeoutSec;
    std::string m_language;
};

} // namespace streamscribe::infrastructure
