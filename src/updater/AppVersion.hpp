#pragma once

#include <filesystem>
#include <string>

namespace updater
{

inline constexpr const char* kFallbackVersion = "1.0.0";

// Version of the installed application as shipped in its .version file
class AppVersion
{
public:
    // First line of path, trimmed; kFallbackVersion when missing or empty
    static std::string readVersionFile(const std::filesystem::path& path);

    // Capitalized pre-release label ("Beta", "Rc") or "Stable"
    static std::string channel(const std::string& version);

    // "v1.2.3 (Stable)", "v1.2.3-beta.1 (Beta)"
    static std::string displayString(const std::string& version);
};

} // namespace updater
