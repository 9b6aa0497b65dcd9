#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "domain/PipelineErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace streamscribe::infrastructure;
using streamscribe::domain::ConfigError;
using json = nlohmann::json;
namespace fs = std::filesystem;

template <typename Fn>
static bool ThrowsConfigError(Fn fn) {
    try {
        fn();
    } catch (const ConfigError& e) {
        std::cout << "  expected error: " << e.what() << std::endl;
        return true;
    }
    return false;
}

int main() {
    std::cout << "[Test] Starting Config Loader Test..." << std::endl;

    const fs::path testRoot = "test_config_root";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    // Defaults
    {
        auto cfg = ConfigLoader::ParseSystemConfig(json::object());
        assert(cfg.inputDir == "input");
        assert(cfg.archiveDir == "archive");
        assert(fs::path(cfg.processedDir) == fs::path("archive") / "originals");
        assert(cfg.failedDir == "failed");
        assert(cfg.concurrency == 4);
        assert(cfg.queueCapacity == 16);
        assert(cfg.mergeIntervalSec == 10);
        assert(cfg.firstSequence == 0);
        assert(cfg.audioExtensions.size() == 1 && cfg.audioExtensions[0] == ".wav");
        assert(cfg.diskThresholdBytes() == 1024ull * 1024 * 1024);
    }
    std::cout << "[PASS] Defaults." << std::endl;

    // Full file, processed_dir follows archive_dir when omitted
    {
        json j = {
            {"input_dir", "in"},
            {"archive_dir", "out"},
            {"failed_dir", "bad"},
            {"disk_threshold_gb", 0},
            {"transcription", {
                {"concurrency", 8},
                {"queue_capacity", 32},
                {"merge_interval", 5},
                {"poll_interval_ms", 100},
                {"settle_ms", 250},
                {"first_sequence", 1},
                {"audio_extensions", {".wav", ".mp3"}}
            }}
        };
        fs::path file = testRoot / "system_config.json";
        {
            std::ofstream out(file);
            out << j.dump(2);
        }
        auto cfg = ConfigLoader::LoadSystemConfig(file.string());
        assert(cfg.inputDir == "in");
        assert(fs::path(cfg.processedDir) == fs::path("out") / "originals");
        assert(cfg.failedDir == "bad");
        assert(cfg.concurrency == 8);
        assert(cfg.queueCapacity == 32);
        assert(cfg.mergeIntervalSec == 5);
        assert(cfg.pollIntervalMs == 100);
        assert(cfg.settleMs == 250);
        assert(cfg.firstSequence == 1);
        assert(cfg.audioExtensions.size() == 2);
        assert(cfg.diskThresholdBytes() == 0);
    }
    std::cout << "[PASS] System config loaded from file." << std::endl;

    // Errors
    {
        assert(ThrowsConfigError([&] { ConfigLoader::LoadSystemConfig((testRoot / "absent.json").string()); }));

        fs::path broken = testRoot / "broken.json";
        {
            std::ofstream out(broken);
            out << "{ \"input_dir\": ";
        }
        assert(ThrowsConfigError([&] { ConfigLoader::LoadSystemConfig(broken.string()); }));

        assert(ThrowsConfigError([] {
            ConfigLoader::ParseSystemConfig(json{{"transcription", {{"concurrency", 0}}}});
        }));
        assert(ThrowsConfigError([] {
            ConfigLoader::ParseSystemConfig(json{{"transcription", {{"queue_capacity", -3}}}});
        }));
        assert(ThrowsConfigError([] {
            ConfigLoader::ParseSystemConfig(json{{"input_dir", 42}});
        }));
        assert(ThrowsConfigError([] {
            ConfigLoader::ParseSystemConfig(json{{"disk_threshold_gb", -1.0}});
        }));
    }
    std::cout << "[PASS] Bad system configs rejected." << std::endl;

    // Model config
    {
        json j = {
            {"default_model", "remote"},
            {"models", {
                {"base", {{"backend", "whisper_cpp"}, {"model_path", "ggml-base.bin"}, {"threads", 2}}},
                {"remote", {{"backend", "whisper_server"}, {"host", "10.0.0.5"}, {"port", 9000}}}
            }}
        };
        auto cfg = ConfigLoader::ParseModelConfig(j);
        assert(cfg.defaultModel == "remote");
        assert(cfg.models.size() == 2);
        assert(cfg.models.at("base").name == "base");
        assert(cfg.models.at("base").threads == 2);
        assert(cfg.models.at("base").language == "auto");
        assert(cfg.models.at("remote").port == 9000);
        assert(cfg.models.at("remote").inferencePath == "/inference");

        auto single = ConfigLoader::ParseModelConfig(json{{"models", {{"only", {{"model_path", "x.bin"}}}}}});
        assert(single.defaultModel == "only");
        assert(single.models.at("only").backend == "whisper_cpp");

        assert(ThrowsConfigError([] { ConfigLoader::ParseModelConfig(json::object()); }));
        assert(ThrowsConfigError([] {
            ConfigLoader::ParseModelConfig(json{{"default_model", "large"}, {"models", {{"base", json::object()}}}});
        }));
    }
    std::cout << "[PASS] Model config." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Config Loader Test completed." << std::endl;
    return 0;
}
