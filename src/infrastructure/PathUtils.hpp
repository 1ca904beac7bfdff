// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace redliner::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetDefaultSettingsPath();
    static std::filesystem::path DefaultManifestPath(const std::filesystem::path& outputPath);
};

} // namespace redliner::infrastructure
