#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace updater
{

// Operating-system side effects the update pipeline needs
class IPlatformServices
{
public:
    virtual ~IPlatformServices() = default;

    // Starts exePath detached with workingDir as its working directory
    virtual bool launch(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                        const std::filesystem::path& workingDir) = 0;

    virtual bool shortcutExists(const std::filesystem::path& shortcutPath) = 0;

    // Leaves an existing shortcut untouched
    virtual bool ensureShortcut(const std::filesystem::path& target, const std::filesystem::path& shortcutPath) = 0;

    // Replaces any existing shortcut with one pointing at target
    virtual bool refreshShortcut(const std::filesystem::path& target, const std::filesystem::path& shortcutPath) = 0;

    // True when a process other than the caller runs executableName
    virtual bool isProcessRunning(const std::string& executableName) = 0;

    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class DesktopPlatform : public IPlatformServices
{
public:
    bool launch(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                const std::filesystem::path& workingDir) override;
    bool shortcutExists(const std::filesystem::path& shortcutPath) override;
    bool ensureShortcut(const std::filesystem::path& target, const std::filesystem::path& shortcutPath) override;
    bool refreshShortcut(const std::filesystem::path& target, const std::filesystem::path& shortcutPath) override;
    bool isProcessRunning(const std::string& executableName) override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

} // namespace updater
