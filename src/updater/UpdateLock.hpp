#pragma once

#include <chrono>
#include <filesystem>
#include <memory>

namespace updater
{

// Exclusive per-installation lock: a file created with O_EXCL semantics that
// holds the owner's PID and is removed when the lock is destroyed
class UpdateLock
{
public:
    // Throws UpdateInProgressError when another live lock exists. A lock file
    // older than staleAfter is treated as abandoned and replaced.
    static std::unique_ptr<UpdateLock> Acquire(const std::filesystem::path& lockPath, std::chrono::minutes staleAfter);
    ~UpdateLock();

    UpdateLock(const UpdateLock&) = delete;
    UpdateLock& operator=(const UpdateLock&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    explicit UpdateLock(std::filesystem::path path);

    static bool tryCreate(const std::filesystem::path& lockPath);
    static bool isStale(const std::filesystem::path& lockPath, std::chrono::minutes staleAfter);

    std::filesystem::path path_;
};

} // namespace updater
