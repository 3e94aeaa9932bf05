#include "ZipExtractor.hpp"
#include "../updater/UpdateErrors.hpp"

#include <plog/Log.h>

#define MINIZ_NO_ZLIB_APIS
#define MINIZ_NO_ARCHIVE_WRITING_APIS
#include <miniz.h>

#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace utils
{

namespace
{

// Owns an initialized miniz reader
struct ZipReader
{
    mz_zip_archive zip{};
    bool open = false;

    ~ZipReader()
    {
        if (open)
        {
            mz_zip_reader_end(&zip);
        }
    }

    std::string lastError() { return mz_zip_get_error_string(mz_zip_get_last_error(&zip)); }
};

struct ZipEntry
{
    mz_uint index;
    std::string name;
    bool isDirectory;
};

std::string normalizeSeparators(std::string name)
{
    std::replace(name.begin(), name.end(), '\\', '/');
    return name;
}

bool isWithin(const fs::path& base, const fs::path& candidate)
{
    auto candidateIt = candidate.begin();
    for (const auto& component : base)
    {
        if (candidateIt == candidate.end() || component != *candidateIt)
            return false;
        ++candidateIt;
    }
    return true;
}

} // namespace

bool ZipExtractor::IsSafeEntry(const std::string& entryName, const fs::path& targetDir)
{
    const std::string name = normalizeSeparators(entryName);
    if (name.empty())
        return false;

    // Drive-qualified names are absolute on Windows even when this build is not
    if (name.size() >= 2 && std::isalpha(static_cast<unsigned char>(name[0])) && name[1] == ':')
        return false;

    const fs::path entry(name);
    if (entry.is_absolute() || entry.has_root_name() || entry.has_root_directory())
        return false;

    std::error_code ec;
    fs::path base = fs::weakly_canonical(targetDir, ec);
    if (ec)
        return false;
    if (base.filename().empty())
        base = base.parent_path();

    const fs::path resolved = fs::weakly_canonical(base / entry, ec);
    if (ec)
        return false;

    return isWithin(base, resolved);
}

size_t ZipExtractor::ExtractZip(const fs::path& zipPath, const fs::path& targetDir)
{
    std::error_code ec;
    if (!fs::is_regular_file(zipPath, ec))
    {
        PLOG_ERROR << "ZIP file does not exist: " << zipPath.string();
        throw updater::CorruptArchiveError("ZIP file does not exist: " + zipPath.string());
    }

    ZipReader reader;
    if (!mz_zip_reader_init_file(&reader.zip, zipPath.string().c_str(), 0))
    {
        const std::string detail = reader.lastError();
        PLOG_ERROR << "Failed to open ZIP archive: " << zipPath.string() << " (" << detail << ")";
        throw updater::CorruptArchiveError("Failed to open ZIP archive: " + zipPath.string(), detail);
    }
    reader.open = true;

    const mz_uint fileCount = mz_zip_reader_get_num_files(&reader.zip);
    PLOG_DEBUG << "Extracting " << zipPath.string() << " to " << targetDir.string();

    // Validate every entry before writing anything
    std::vector<ZipEntry> entries;
    entries.reserve(fileCount);
    for (mz_uint i = 0; i < fileCount; ++i)
    {
        mz_zip_archive_file_stat fileStat{};
        if (!mz_zip_reader_file_stat(&reader.zip, i, &fileStat))
        {
            const std::string detail = reader.lastError();
            PLOG_ERROR << "Failed to read file stat from ZIP: " << detail;
            throw updater::CorruptArchiveError("Failed to read ZIP directory", detail);
        }

        std::string name = fileStat.m_filename;
        if (!IsSafeEntry(name, targetDir))
        {
            PLOG_ERROR << "Unsafe path in ZIP: '" << name << "' escapes " << targetDir.string();
            throw updater::UnsafeArchiveError("Unsafe path in ZIP: " + name, targetDir.string());
        }

        entries.push_back({ i, normalizeSeparators(name), fileStat.m_is_directory != 0 });
    }

    fs::create_directories(targetDir);

    size_t written = 0;
    for (const auto& entry : entries)
    {
        const fs::path destPath = targetDir / fs::path(entry.name);

        if (entry.isDirectory)
        {
            fs::create_directories(destPath);
            continue;
        }

        PLOG_VERBOSE << "Extracting: '" << entry.name << "' -> '" << destPath.string() << "'";
        fs::create_directories(destPath.parent_path());

        if (!mz_zip_reader_extract_to_file(&reader.zip, entry.index, destPath.string().c_str(), 0))
        {
            const std::string detail = reader.lastError();
            PLOG_ERROR << "Failed to extract file: " << entry.name << " (" << detail << ")";
            throw updater::CorruptArchiveError("Failed to extract file: " + entry.name, detail);
        }
        ++written;
    }

    PLOG_INFO << "Extracted " << written << " files from " << zipPath.filename().string();
    return written;
}

} // namespace utils
