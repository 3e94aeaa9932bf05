#pragma once

#include "UpdateTypes.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace updater
{

// Locates and checks a onedir package (executable + support directory)
class LayoutProbe
{
public:
    // Directory holding exeName anywhere under searchDir. Empty result when no
    // match exists or the first match (in traversal order) is a zero-byte file.
    static std::optional<std::filesystem::path> findExecutableRoot(const std::filesystem::path& searchDir,
                                                                   const std::string& exeName);

    // Executable present as a file and support directory present as a directory
    static bool verifyLayout(const InstallationLayout& layout);
};

} // namespace updater
