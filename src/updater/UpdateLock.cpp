#include "UpdateLock.hpp"
#include "UpdateErrors.hpp"

#include <plog/Log.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>

#ifdef _WIN32
#include <process.h>
#define CABPLANNER_GETPID _getpid
#else
#include <unistd.h>
#define CABPLANNER_GETPID getpid
#endif

namespace fs = std::filesystem;

namespace updater
{

UpdateLock::UpdateLock(fs::path path)
    : path_(std::move(path))
{
}

UpdateLock::~UpdateLock()
{
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec)
    {
        PLOG_WARNING << "Failed to release update lock " << path_.string() << ": " << ec.message();
    }
    else
    {
        PLOG_DEBUG << "Update lock released: " << path_.string();
    }
}

std::unique_ptr<UpdateLock> UpdateLock::Acquire(const fs::path& lockPath, std::chrono::minutes staleAfter)
{
    if (tryCreate(lockPath))
    {
        PLOG_INFO << "Update lock acquired: " << lockPath.string();
        return std::unique_ptr<UpdateLock>(new UpdateLock(lockPath));
    }

    const int createErrno = errno;
    std::error_code ec;
    if (!fs::exists(lockPath, ec))
    {
        throw UpdateException(UpdateErrorKind::Unknown, "Could not create update lock",
                              lockPath.string() + ": " + std::strerror(createErrno));
    }

    std::string owner;
    {
        std::ifstream in(lockPath);
        std::getline(in, owner);
    }

    if (!isStale(lockPath, staleAfter))
    {
        PLOG_WARNING << "Another update is in progress (lock held by pid " << (owner.empty() ? "?" : owner) << ")";
        throw UpdateInProgressError("Another update is already running for this installation",
                                    lockPath.string() + " held by pid " + (owner.empty() ? "?" : owner));
    }

    PLOG_WARNING << "Replacing stale update lock " << lockPath.string() << " (pid " << (owner.empty() ? "?" : owner)
                 << ")";
    fs::remove(lockPath, ec);
    if (ec || !tryCreate(lockPath))
    {
        throw UpdateInProgressError("Another update is already running for this installation",
                                    "stale lock could not be replaced: " + lockPath.string());
    }

    PLOG_INFO << "Update lock acquired: " << lockPath.string();
    return std::unique_ptr<UpdateLock>(new UpdateLock(lockPath));
}

bool UpdateLock::tryCreate(const fs::path& lockPath)
{
    // "x" fails if the file already exists (C11 exclusive mode)
#ifdef _WIN32
    FILE* file = _wfopen(lockPath.wstring().c_str(), L"wx");
#else
    FILE* file = std::fopen(lockPath.string().c_str(), "wx");
#endif
    if (!file)
        return false;

    std::fprintf(file, "%d\n", static_cast<int>(CABPLANNER_GETPID()));
    std::fclose(file);
    return true;
}

bool UpdateLock::isStale(const fs::path& lockPath, std::chrono::minutes staleAfter)
{
    std::error_code ec;
    const auto written = fs::last_write_time(lockPath, ec);
    if (ec)
        return false;

    const auto age = fs::file_time_type::clock::now() - written;
    return age > staleAfter;
}

} // namespace updater

#undef CABPLANNER_GETPID
