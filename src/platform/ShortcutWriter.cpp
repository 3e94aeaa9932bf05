#include "ShortcutWriter.hpp"

#include <plog/Log.h>

#include <system_error>

#ifdef _WIN32
#include <windows.h>
#include <objbase.h>
#include <shlobj.h>
#include <shobjidl.h>
#else
#include <fstream>
#endif

namespace fs = std::filesystem;

fs::path ShortcutWriter::platformPath(const fs::path& requested)
{
#ifdef _WIN32
    return requested;
#else
    fs::path path = requested;
    path.replace_extension(".desktop");
    return path;
#endif
}

bool ShortcutWriter::exists(const fs::path& requested)
{
    std::error_code ec;
    return fs::exists(platformPath(requested), ec);
}

bool ShortcutWriter::ensureShortcut(const fs::path& target, const fs::path& requested, const std::string& description)
{
    const fs::path shortcutPath = platformPath(requested);

    std::error_code ec;
    if (fs::exists(shortcutPath, ec))
    {
        PLOG_DEBUG << "Shortcut already exists: " << shortcutPath.string();
        return true;
    }

    if (!fs::exists(target, ec))
    {
        PLOG_ERROR << "Executable not found: " << target.string();
        return false;
    }

    if (!writeShortcut(target, shortcutPath, description))
        return false;

    PLOG_INFO << "Shortcut created successfully: " << shortcutPath.string();
    return true;
}

bool ShortcutWriter::refreshShortcut(const fs::path& target, const fs::path& requested, const std::string& description)
{
    const fs::path shortcutPath = platformPath(requested);

    std::error_code ec;
    if (!fs::exists(target, ec))
    {
        PLOG_ERROR << "Executable not found: " << target.string();
        return false;
    }

    if (fs::exists(shortcutPath, ec))
    {
        fs::remove(shortcutPath, ec);
        if (ec)
        {
            PLOG_ERROR << "Could not remove old shortcut " << shortcutPath.string() << ": " << ec.message();
            return false;
        }
        PLOG_INFO << "Removed old shortcut: " << shortcutPath.string();
    }

    return ensureShortcut(target, requested, description);
}

#ifdef _WIN32
bool ShortcutWriter::writeShortcut(const fs::path& target, const fs::path& shortcutPath,
                                   const std::string& description)
{
    HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
    const bool uninitialize = SUCCEEDED(hr);
    if (FAILED(hr) && hr != RPC_E_CHANGED_MODE)
    {
        PLOG_ERROR << "CoInitializeEx failed: 0x" << std::hex << hr;
        return false;
    }

    bool saved = false;
    IShellLinkW* link = nullptr;
    hr = CoCreateInstance(CLSID_ShellLink, nullptr, CLSCTX_INPROC_SERVER, IID_IShellLinkW,
                          reinterpret_cast<void**>(&link));
    if (SUCCEEDED(hr))
    {
        const std::wstring targetPath = target.wstring();
        const std::wstring workingDir = target.parent_path().wstring();
        const std::wstring desc(description.begin(), description.end());

        link->SetPath(targetPath.c_str());
        link->SetWorkingDirectory(workingDir.c_str());
        link->SetIconLocation(targetPath.c_str(), 0);
        link->SetDescription(desc.c_str());

        IPersistFile* file = nullptr;
        hr = link->QueryInterface(IID_IPersistFile, reinterpret_cast<void**>(&file));
        if (SUCCEEDED(hr))
        {
            hr = file->Save(shortcutPath.wstring().c_str(), TRUE);
            saved = SUCCEEDED(hr);
            file->Release();
        }
        link->Release();
    }

    if (!saved)
    {
        PLOG_ERROR << "Failed to create shortcut " << shortcutPath.string() << ": HRESULT 0x" << std::hex << hr;
    }

    if (uninitialize)
    {
        CoUninitialize();
    }
    return saved;
}
#else
bool ShortcutWriter::writeShortcut(const fs::path& target, const fs::path& shortcutPath,
                                   const std::string& description)
{
    {
        std::ofstream entry(shortcutPath, std::ios::out | std::ios::trunc);
        if (!entry.is_open())
        {
            PLOG_ERROR << "Failed to create shortcut file: " << shortcutPath.string();
            return false;
        }

        entry << "[Desktop Entry]\n"
              << "Type=Application\n"
              << "Name=" << shortcutPath.stem().string() << "\n"
              << "Comment=" << description << "\n"
              << "Exec=\"" << target.string() << "\"\n"
              << "Path=" << target.parent_path().string() << "\n"
              << "Terminal=false\n";

        entry.close();
        if (entry.fail())
        {
            PLOG_ERROR << "Failed to write shortcut file: " << shortcutPath.string();
            return false;
        }
    }

    std::error_code ec;
    fs::permissions(shortcutPath, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec)
    {
        PLOG_WARNING << "Could not mark shortcut executable: " << ec.message();
    }
    return true;
}
#endif
