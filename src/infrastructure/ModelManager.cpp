#include "infrastructure/ModelManager.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/WhisperCppAdapter.hpp"
#include "infrastructure/WhisperServerAdapter.hpp"
#include <iostream>

namespace streamscribe::infrastructure {

ModelManager::ModelManager(ModelConfig config)
    : m_config(std::move(config)) {}

std::shared_ptr<domain::TranscriptionService> ModelManager::acquire() {
    return acquire(m_config.defaultModel);
}

std::shared_ptr<domain::TranscriptionService> ModelManager::acquire(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto cached = m_cache.find(name);
    if (cached != m_cache.end()) {
        return cached->second;
    }

    auto it = m_config.models.find(name);
    if (it == m_config.models.end()) {
        throw domain::ModelUnavailable("Unknown model '" + name + "'");
    }

    auto service = create(it->second);
    m_cache.emplace(name, service);
    std::cout << "[ModelManager] Model '" << name << "' ready (" << service->backendName() << ")" << std::endl;
    return service;
}

size_t ModelManager::cachedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.size();
}

std::vector<std::string> ModelManager::cachedModels() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    for (const auto& entry : m_cache) {
        names.push_back(entry.first);
    }
    return names;
}

void ModelManager::clearCache() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_cache.empty()) {
        std::cout << "[ModelManager] Releasing " << m_cache.size() << " cached model(s)" << std::endl;
    }
    m_cache.clear();
}

std::shared_ptr<domain::TranscriptionService> ModelManager::create(const ModelEntry& entry) const {
    if (entry.backend == "whisper_cpp") {
        auto path = PathUtils::ResolveModelPath(entry.modelPath);
        return std::make_shared<WhisperCppAdapter>(path.string(), entry.language, entry.threads);
    }
    if (entry.backend == "whisper_server") {
        return std::make_shared<WhisperServerAdapter>(entry.host, entry.port, entry.inferencePath,
                                                      entry.timeoutSec, entry.language);
    }
    throw domain::ModelUnavailable("Model '" + entry.name + "' uses unsupported backend '" + entry.backend + "'");
}

} // namespace streamscribe::infrastructure
