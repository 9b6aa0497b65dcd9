// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace streamscribe::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetModelsDir();

    /** @brief Default location of a StreamScribe configuration file. */
    static std::filesystem::path GetConfigFile(const std::string& filename);

    /** @brief Resolves a model path; relative paths are taken from GetModelsDir(). */
    static std::filesystem::path ResolveModelPath(const std::string& modelPath);
};

} // namespace streamscribe::infrastructure
