#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace utils
{

// Cross-platform ZIP extraction using miniz library, hardened against zip-slip
class ZipExtractor
{
public:
    // Extract ZIP archive to target directory (created if absent).
    // Every entry name is validated before any byte is written: a single entry
    // resolving outside targetDir throws updater::UnsafeArchiveError and nothing
    // is extracted. An unreadable container throws updater::CorruptArchiveError.
    // Returns the number of files written.
    static size_t ExtractZip(const std::filesystem::path& zipPath, const std::filesystem::path& targetDir);

    // True when entryName, joined to targetDir and canonicalized, stays beneath targetDir
    static bool IsSafeEntry(const std::string& entryName, const std::filesystem::path& targetDir);
};

} // namespace utils
