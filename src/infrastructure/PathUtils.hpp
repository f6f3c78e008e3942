// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace docling::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_CONFIG_HOME/docling/settings.json (or ~/.config/...). */
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace docling::infrastructure
