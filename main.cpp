#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "application/TranscriptionPipeline.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ModelManager.hpp"

using namespace streamscribe;

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void HandleSignal(int) {
    g_stopRequested = 1;
}

void PrintStatus(const application::PipelineStats& s) {
    std::cout << "[StreamScribe] dispatched=" << s.dispatched
              << " queued=" << s.queued
              << " running=" << s.inFlight
              << " succeeded=" << s.succeeded
              << " failed=" << s.failed
              << " buffered=" << s.buffered
              << " archived=" << s.archivedFragments << " (" << s.archives << " file(s))"
              << " next=" << s.cursor
              << (s.diskLow ? " [DISK LOW]" : "")
              << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    const std::string systemConfigPath = argc > 1 ? argv[1] : "";
    const std::string modelConfigPath = argc > 2 ? argv[2] : "";

    application::PipelineConfig config;
    infrastructure::ModelConfig models;
    try {
        config = infrastructure::ConfigLoader::LoadSystemConfig(systemConfigPath);
        models = infrastructure::ConfigLoader::LoadModelConfig(modelConfigPath);
    } catch (const domain::ConfigError& e) {
        std::cerr << "[StreamScribe] " << e.what() << std::endl;
        std::cerr << "Usage: " << argv[0] << " [system_config.json] [model_config.json]" << std::endl;
        return 1;
    }

    std::cout << "StreamScribe - fragment transcription pipeline" << std::endl;
    std::cout << "  input:    " << config.inputDir << std::endl;
    std::cout << "  archive:  " << config.archiveDir << std::endl;
    std::cout << "  failed:   " << config.failedDir << std::endl;
    std::cout << "  model:    " << models.defaultModel << std::endl;
    std::cout << "  workers:  " << config.concurrency << " (queue " << config.queueCapacity << ")" << std::endl;

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try {
        auto provider = std::make_shared<infrastructure::ModelManager>(models);
        application::TranscriptionPipeline pipeline(config, provider);
        pipeline.start();

        const auto statusInterval = std::chrono::seconds(30);
        auto lastStatus = std::chrono::steady_clock::now();
        while (!g_stopRequested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            auto now = std::chrono::steady_clock::now();
            if (now - lastStatus >= statusInterval) {
                PrintStatus(pipeline.stats());
                lastStatus = now;
            }
        }

        std::cout << "[StreamScribe] Shutdown requested, finishing in-flight fragments..." << std::endl;
        pipeline.stop();
        PrintStatus(pipeline.stats());
    } catch (const std::exception& e) {
        std::cerr << "[StreamScribe] Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
