#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace updater
{

class BackupManager;

// Paths moved aside during one swap. Only BackupManager can produce one, so a
// rollback can never be requested before the backup exists.
class BackupSet
{
public:
    struct Entry
    {
        std::filesystem::path original;
        std::filesystem::path backup;
    };

    BackupSet(BackupSet&&) noexcept = default;
    BackupSet& operator=(BackupSet&&) noexcept = default;
    BackupSet(const BackupSet&) = delete;
    BackupSet& operator=(const BackupSet&) = delete;

    const std::vector<Entry>& entries() const { return entries_; }

    bool empty() const { return entries_.empty(); }

private:
    friend class BackupManager;
    BackupSet() = default;

    std::vector<Entry> entries_;
};

class BackupManager
{
public:
    explicit BackupManager(std::string suffix = ".bak");
    ~BackupManager() = default;

    std::filesystem::path backupPathFor(const std::filesystem::path& original) const;

    // Renames each existing path to its sibling backup path, removing a stale
    // backup first. Paths that do not exist are skipped. If a rename fails the
    // paths already moved are put back and SwapError is thrown.
    BackupSet moveAside(const std::vector<std::filesystem::path>& paths) const;

    // Puts every backup back in place, deleting whatever now occupies the
    // original path. Throws RollbackFailedError naming the first path that could
    // not be restored; the remaining entries are still attempted. That failure is
    // also queued as the Fatal report carrying both paths.
    void restore(BackupSet&& backup) const;

    // Deletes the backups after a successful swap. Failures are logged only.
    void discard(BackupSet&& backup) const;

private:
    std::string suffix_;
};

} // namespace updater
