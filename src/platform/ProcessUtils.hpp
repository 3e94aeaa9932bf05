#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace utils
{

class ProcessUtils
{
public:
    // Absolute path of the running updater, empty when it cannot be determined
    static std::filesystem::path GetExecutablePath();

    // Starts exePath in its own session so it outlives the updater.
    // An empty workingDir keeps the caller's working directory.
    static bool LaunchDetached(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                               const std::filesystem::path& workingDir = {});

    // Windows command-line quoting for a single argument
    static std::wstring QuoteArgument(const std::wstring& arg);
};

} // namespace utils
