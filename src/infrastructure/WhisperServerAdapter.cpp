#include "infrastructure/WhisperServerAdapter.hpp"
#include "domain/PipelineErrors.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace streamscribe::infrastructure {

using json = nlohmann::json;

WhisperServerAdapter::WhisperServerAdapter(const std::string& host, int port,
                                           const std::string& inferencePath,
                                           int timeoutSec,
                                           const std::string& language)
    : m_host(host), m_port(port), m_inferencePath(inferencePath), m_timeoutSec(timeoutSec), m_language(language) {}

std::string WhisperServerAdapter::transcribe(const std::string& audioBytes, const std::string& sourceName) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(m_timeoutSec);
    cli.set_write_timeout(m_timeoutSec);

    httplib::MultipartFormDataItems items = {
        {"file", audioBytes, sourceName, "application/octet-stream"},
        {"response_format", "json", "", ""},
        {"temperature", "0.0", "", ""},
    };
    if (!m_language.empty() && m_language != "auto") {
        items.push_back({"language", m_language, "", ""});
    }

    auto res = cli.Post(m_inferencePath, items);
    if (!res) {
        throw domain::ModelUnavailable("Connection to whisper server " + m_host + ":" + std::to_string(m_port) +
                                       " failed. Error code: " + std::to_string(static_cast<int>(res.error())));
    }
    if (res->status != 200) {
        throw domain::TranscriptionError("Whisper server HTTP " + std::to_string(res->status) + " for " +
                                         sourceName + ": " + res->body);
    }
    return ParseInferenceResponse(res->body);
}

std::string WhisperServerAdapter::ParseInferenceResponse(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        throw domain::TranscriptionError(std::string("Whisper server JSON parse error: ") + e.what());
    }

    if (j.contains("error")) {
        throw domain::TranscriptionError("Whisper server error: " + j["error"].dump());
    }
    if (!j.contains("text") || !j["text"].is_string()) {
        throw domain::TranscriptionError("Whisper server response missing 'text' field: " + body);
    }

    std::string text = j["text"].get<std::string>();
    size_t first = text.find_first_not_of(" \n");
    size_t last = text.find_last_not_of(" \n");
    return first == std::string::npos ? std::string() : text.substr(first, last - first + 1);
}

} // namespace streamscribe::infrastructure
