// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace modlink::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetSettingsFile();
    static std::filesystem::path GetDefaultContentRoot();
    static std::filesystem::path GetDefaultLinksRoot();
};

} // namespace modlink::infrastructure
