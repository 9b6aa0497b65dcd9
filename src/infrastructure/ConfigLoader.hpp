/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading system_config.json and model_config.json.
 *
 * Keeps JSON parsing in one place; the rest of the code only sees the
 * PipelineConfig and ModelConfig structs.
 */

#pragma once

#include "application/PipelineConfig.hpp"
#include "infrastructure/ModelConfig.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace streamscribe::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads the pipeline settings. Missing keys keep their defaults.
     * @param path JSON file; empty means PathUtils::GetConfigFile("system_config.json").
     * @throws domain::ConfigError if the file is missing, malformed or out of range.
     */
    static application::PipelineConfig LoadSystemConfig(const std::string& path = "");

    /**
     * @brief Reads the recognizer definitions.
     * @param path JSON file; empty means PathUtils::GetConfigFile("model_config.json").
     * @throws domain::ConfigError if the file is missing, malformed, or the default model is undefined.
     */
    static ModelConfig LoadModelConfig(const std::string& path = "");

    static application::PipelineConfig ParseSystemConfig(const nlohmann::json& j);
    static ModelConfig ParseModelConfig(const nlohmann::json& j);
};

} // namespace streamscribe::infrastructure
