#include "LayoutProbe.hpp"

#include <plog/Log.h>

#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace updater
{

std::optional<fs::path> LayoutProbe::findExecutableRoot(const fs::path& searchDir, const std::string& exeName)
{
    PLOG_DEBUG << "Searching for " << exeName << " in " << searchDir.string();

    std::error_code ec;
    std::vector<fs::path> matches;
    for (fs::recursive_directory_iterator it(searchDir, ec), end; !ec && it != end; it.increment(ec))
    {
        if (it->path().filename() == exeName && it->is_regular_file(ec))
        {
            matches.push_back(it->path());
        }
    }

    if (ec)
    {
        PLOG_ERROR << "Failed to scan " << searchDir.string() << ": " << ec.message();
        return std::nullopt;
    }

    if (matches.empty())
    {
        PLOG_ERROR << "Executable " << exeName << " not found in extracted files";
        return std::nullopt;
    }

    if (matches.size() > 1)
    {
        PLOG_WARNING << "Multiple " << exeName << " files found, using first one";
        for (const auto& match : matches)
        {
            PLOG_WARNING << "Found: " << match.string();
        }
    }

    const fs::path& exePath = matches.front();
    const auto size = fs::file_size(exePath, ec);
    if (ec || size == 0)
    {
        PLOG_ERROR << "Executable " << exePath.string() << " is empty";
        return std::nullopt;
    }

    PLOG_DEBUG << "Found application root: " << exePath.parent_path().string();
    return exePath.parent_path();
}

bool LayoutProbe::verifyLayout(const InstallationLayout& layout)
{
    std::error_code ec;

    if (!fs::is_regular_file(layout.executable(), ec))
    {
        PLOG_ERROR << "Missing " << layout.executableName << " in " << layout.root.string();
        return false;
    }

    const fs::path supportDir = layout.supportDir();
    if (!fs::exists(supportDir, ec))
    {
        PLOG_ERROR << "Missing " << layout.supportDirName << "/ directory in " << layout.root.string();
        return false;
    }
    if (!fs::is_directory(supportDir, ec))
    {
        PLOG_ERROR << supportDir.string() << " exists but is not a directory";
        return false;
    }

    PLOG_DEBUG << "Verified onedir structure in " << layout.root.string();
    return true;
}

} // namespace updater
