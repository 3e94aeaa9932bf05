#pragma once

#include <filesystem>
#include <string>

// Desktop launch shortcuts: a .lnk via IShellLinkW on Windows, a freedesktop
// .desktop entry elsewhere
class ShortcutWriter
{
public:
    // Path actually written for a requested shortcut (extension swapped off Windows)
    static std::filesystem::path platformPath(const std::filesystem::path& requested);

    static bool exists(const std::filesystem::path& requested);

    // No-op returning true when the shortcut is already there
    static bool ensureShortcut(const std::filesystem::path& target, const std::filesystem::path& requested,
                               const std::string& description);

    // Removes an existing shortcut first, then writes a new one
    static bool refreshShortcut(const std::filesystem::path& target, const std::filesystem::path& requested,
                                const std::string& description);

private:
    static bool writeShortcut(const std::filesystem::path& target, const std::filesystem::path& shortcutPath,
                              const std::string& description);
};
