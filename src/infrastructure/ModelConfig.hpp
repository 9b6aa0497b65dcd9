/**
 * @file ModelConfig.hpp
 * @brief Recognizer definitions read from model_config.json.
 */

#pragma once
#include <map>
#include <string>

namespace streamscribe::infrastructure {

/**
 * @struct ModelEntry
 * @brief One named recognizer. Which fields matter depends on the backend.
 */
struct ModelEntry {
    std::string name;
    std::string backend = "whisper_cpp"; ///< "whisper_cpp" or "whisper_server".

    // whisper_cpp
    std::string modelPath;
    std::string language = "auto";
    int threads = 4;

    // whisper_server
    std::string host = "127.0.0.1";
    int port = 8080;
    std::string inferencePath = "/inference";
    int timeoutSec = 30;
};

struct ModelConfig {
    std::string defaultModel;
    std::map<std::string, ModelEntry> models;
};

} // namespace streamscribe::infrastructure
