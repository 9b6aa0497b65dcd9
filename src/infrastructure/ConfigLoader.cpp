/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace streamscribe::infrastructure {

using json = nlohmann::json;

namespace {

json ReadJsonFile(const std::filesystem::path& configPath) {
    if (!std::filesystem::exists(configPath)) {
        throw domain::ConfigError("Config file not found: " + configPath.string());
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        throw domain::ConfigError("Cannot open config file: " + configPath.string());
    }

    try {
        json j;
        f >> j;
        return j;
    } catch (const json::exception& e) {
        throw domain::ConfigError("Error reading " + configPath.string() + ": " + e.what());
    }
}

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw domain::ConfigError(message);
    }
}

} // namespace

application::PipelineConfig ConfigLoader::ParseSystemConfig(const json& j) {
    application::PipelineConfig cfg;
    try {
        cfg.inputDir = j.value("input_dir", cfg.inputDir);
        cfg.archiveDir = j.value("archive_dir", cfg.archiveDir);
        cfg.processedDir = j.value("processed_dir", (std::filesystem::path(cfg.archiveDir) / "originals").string());
        cfg.failedDir = j.value("failed_dir", cfg.failedDir);
        cfg.diskThresholdGb = j.value("disk_threshold_gb", cfg.diskThresholdGb);

        if (j.contains("transcription")) {
            const json& t = j.at("transcription");
            long long concurrency = t.value("concurrency", static_cast<long long>(cfg.concurrency));
            long long capacity = t.value("queue_capacity", static_cast<long long>(cfg.queueCapacity));
            Require(concurrency >= 1, "transcription.concurrency must be >= 1");
            Require(capacity >= 1, "transcription.queue_capacity must be >= 1");
            cfg.concurrency = static_cast<size_t>(concurrency);
            cfg.queueCapacity = static_cast<size_t>(capacity);
            cfg.mergeIntervalSec = t.value("merge_interval", cfg.mergeIntervalSec);
            cfg.pollIntervalMs = t.value("poll_interval_ms", cfg.pollIntervalMs);
            cfg.settleMs = t.value("settle_ms", cfg.settleMs);
            cfg.firstSequence = t.value("first_sequence", cfg.firstSequence);
            if (t.contains("audio_extensions")) {
                cfg.audioExtensions = t.at("audio_extensions").get<std::vector<std::string>>();
            }
        }
    } catch (const json::exception& e) {
        throw domain::ConfigError(std::string("Invalid system config: ") + e.what());
    }

    Require(!cfg.inputDir.empty(), "input_dir must not be empty");
    Require(!cfg.archiveDir.empty(), "archive_dir must not be empty");
    Require(!cfg.failedDir.empty(), "failed_dir must not be empty");
    Require(cfg.diskThresholdGb >= 0.0, "disk_threshold_gb must be >= 0");
    Require(cfg.mergeIntervalSec >= 1, "transcription.merge_interval must be >= 1");
    Require(cfg.pollIntervalMs >= 1, "transcription.poll_interval_ms must be >= 1");
    Require(cfg.settleMs >= 0, "transcription.settle_ms must be >= 0");
    Require(cfg.firstSequence >= 0, "transcription.first_sequence must be >= 0");
    return cfg;
}

ModelConfig ConfigLoader::ParseModelConfig(const json& j) {
    ModelConfig cfg;
    try {
        cfg.defaultModel = j.value("default_model", std::string());
        if (j.contains("models")) {
            for (const auto& [name, m] : j.at("models").items()) {
                ModelEntry entry;
                entry.name = name;
                entry.backend = m.value("backend", entry.backend);
                entry.modelPath = m.value("model_path", entry.modelPath);
                entry.language = m.value("language", entry.language);
                entry.threads = m.value("threads", entry.threads);
                entry.host = m.value("host", entry.host);
                entry.port = m.value("port", entry.port);
                entry.inferencePath = m.value("inference_path", entry.inferencePath);
                entry.timeoutSec = m.value("timeout_sec", entry.timeoutSec);
                cfg.models.emplace(name, entry);
            }
        }
    } catch (const json::exception& e) {
        throw domain::ConfigError(std::string("Invalid model config: ") + e.what());
    }

    if (cfg.defaultModel.empty() && cfg.models.size() == 1) {
        cfg.defaultModel = cfg.models.begin()->first;
    }
    Require(!cfg.models.empty(), "model config defines no models");
    Require(cfg.models.count(cfg.defaultModel) > 0, "default_model '" + cfg.defaultModel + "' is not defined");
    return cfg;
}

application::PipelineConfig ConfigLoader::LoadSystemConfig(const std::string& path) {
    std::filesystem::path configPath = path.empty() ? PathUtils::GetConfigFile("system_config.json") : std::filesystem::path(path);
    std::cout << "[ConfigLoader] Loading " << configPath.string() << std::endl;
    return ParseSystemConfig(ReadJsonFile(configPath));
}

ModelConfig ConfigLoader::LoadModelConfig(const std::string& path) {
    std::filesystem::path configPath = path.empty() ? PathUtils::GetConfigFile("model_config.json") : std::filesystem::path(path);
    std::cout << "[ConfigLoader] Loading " << configPath.string() << std::endl;
    return ParseModelConfig(ReadJsonFile(configPath));
}

} // namespace streamscribe::infrastructure
