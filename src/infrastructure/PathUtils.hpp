// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace fieldplan::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetAppConfigDir();
    static std::filesystem::path GetSettingsPath();
};

} // namespace fieldplan::infrastructure
