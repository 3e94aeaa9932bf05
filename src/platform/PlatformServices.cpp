#include "PlatformServices.hpp"
#include "ProcessDetector.hpp"
#include "ProcessUtils.hpp"
#include "ShortcutWriter.hpp"

#include <plog/Log.h>

#include <thread>

namespace updater
{

bool DesktopPlatform::launch(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                             const std::filesystem::path& workingDir)
{
    return utils::ProcessUtils::LaunchDetached(exePath, args, workingDir);
}

bool DesktopPlatform::shortcutExists(const std::filesystem::path& shortcutPath)
{
    return ShortcutWriter::exists(shortcutPath);
}

bool DesktopPlatform::ensureShortcut(const std::filesystem::path& target, const std::filesystem::path& shortcutPath)
{
    return ShortcutWriter::ensureShortcut(target, shortcutPath, "Cabplanner");
}

bool DesktopPlatform::refreshShortcut(const std::filesystem::path& target, const std::filesystem::path& shortcutPath)
{
    return ShortcutWriter::refreshShortcut(target, shortcutPath, "Cabplanner");
}

bool DesktopPlatform::isProcessRunning(const std::string& executableName)
{
    const auto instances = ProcessDetector::findInstances(executableName);
    if (instances.empty())
        return false;

    PLOG_DEBUG << instances.size() << " instance(s) of " << executableName << " still running, first pid "
               << instances.front().pid;
    return true;
}

void DesktopPlatform::sleepFor(std::chrono::milliseconds duration)
{
    std::this_thread::sleep_for(duration);
}

} // namespace updater
