#include "AppVersion.hpp"

#include <plog/Log.h>

#include <cctype>
#include <fstream>
#include <regex>

namespace updater
{

namespace
{

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

std::string AppVersion::readVersionFile(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        PLOG_WARNING << "Could not read version file (" << path.string() << "), using " << kFallbackVersion;
        return kFallbackVersion;
    }

    std::string line;
    std::getline(in, line);
    line = trim(line);
    return line.empty() ? std::string(kFallbackVersion) : line;
}

std::string AppVersion::channel(const std::string& version)
{
    static const std::regex pattern(R"(^[0-9]+\.[0-9]+\.[0-9]+(?:-([A-Za-z0-9.]+))?$)");

    std::smatch match;
    if (!std::regex_match(version, match, pattern) || !match[1].matched)
        return "Stable";

    std::string label = match[1].str();
    label = label.substr(0, label.find('.'));
    if (label.empty())
        return "Stable";

    for (auto& c : label)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
    return label;
}

std::string AppVersion::displayString(const std::string& version)
{
    return "v" + version + " (" + channel(version) + ")";
}

} // namespace updater
