/**
 * @file ModelManager.hpp
 * @brief Builds and caches transcribers described by model_config.json.
 */

#pragma once

#include "domain/TranscriptionService.hpp"
#include "infrastructure/ModelConfig.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace streamscribe::infrastructure {

/**
 * @class ModelManager
 * @brief ModelProvider with one shared instance per model name.
 *
 * Workers call acquire() for every fragment; the first call creates the
 * backend and later calls return the cached instance.
 */
class ModelManager : public domain::ModelProvider {
public:
    explicit ModelManager(ModelConfig config);

    std::shared_ptr<domain::TranscriptionService> acquire() override;

    /**
     * @brief Returns the transcriber registered under @p name.
     * @throws domain::ModelUnavailable for an unknown name or backend.
     */
    std::shared_ptr<domain::TranscriptionService> acquire(const std::string& name);

    size_t cachedCount() const;

    /** @brief Names of the models currently loaded, sorted. */
    std::vector<std::string> cachedModels() const;

    /**
     * @brief Drops every cached transcriber. A model is released once no
     *        running job holds it any more; the next acquire() creates it again.
     */
    void clearCache();
    const ModelConfig& config() const { return m_config; }

private:
    ModelConfig m_config;
    std::map<std::string, std::shared_ptr<domain::TranscriptionService>> m_cache;
    mutable std::mutex m_mutex;

    std::shared_ptr<domain::TranscriptionService> create(const ModelEntry& entry) const;
};

} // namespace streamscribe::infrastructure
