#include "BackupManager.hpp"
#include "UpdateErrors.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <system_error>

namespace fs = std::filesystem;

namespace updater
{

BackupManager::BackupManager(std::string suffix)
    : suffix_(std::move(suffix))
{
}

fs::path BackupManager::backupPathFor(const fs::path& original) const
{
    fs::path backup = original;
    backup += suffix_;
    return backup;
}

BackupSet BackupManager::moveAside(const std::vector<fs::path>& paths) const
{
    BackupSet backup;

    for (const auto& original : paths)
    {
        std::error_code ec;
        if (!fs::exists(original, ec))
        {
            PLOG_WARNING << "Nothing to back up at " << original.string();
            continue;
        }

        const fs::path backupPath = backupPathFor(original);
        try
        {
            if (fs::exists(backupPath))
            {
                PLOG_INFO << "Removing stale backup: " << backupPath.string();
                fs::remove_all(backupPath);
            }

            fs::rename(original, backupPath);
            backup.entries_.push_back({ original, backupPath });
            PLOG_INFO << "Backed up: " << original.string() << " -> " << backupPath.string();
        }
        catch (const fs::filesystem_error& e)
        {
            PLOG_ERROR << "Failed to back up " << original.string() << ": " << e.what();
            try
            {
                restore(std::move(backup));
            }
            catch (const RollbackFailedError& rollback)
            {
                throw RollbackFailedError(rollback.what(), std::string("while backing up: ") + e.what());
            }
            throw SwapError("Failed to back up " + original.filename().string(), e.what());
        }
    }

    return backup;
}

void BackupManager::restore(BackupSet&& backup) const
{
    std::string firstFailure;
    std::string failureDetails;

    // Undo in reverse order of the moves
    for (auto it = backup.entries_.rbegin(); it != backup.entries_.rend(); ++it)
    {
        try
        {
            if (fs::exists(it->original))
            {
                fs::remove_all(it->original);
            }
            fs::rename(it->backup, it->original);
            PLOG_INFO << "Restored: " << it->backup.string() << " -> " << it->original.string();
        }
        catch (const fs::filesystem_error& e)
        {
            PLOG_FATAL << "Could not restore " << it->original.string() << " from " << it->backup.string() << ": "
                       << e.what();
            if (firstFailure.empty())
            {
                firstFailure = it->original.string();
                failureDetails = "backup: " + it->backup.string() + ", target: " + it->original.string() + " (" +
                                 e.what() + ")";
            }
        }
    }
    backup.entries_.clear();

    if (!firstFailure.empty())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Installation,
                                          "Update failed and the previous version could not be restored. "
                                          "Reinstall the application manually.",
                                          failureDetails);
        throw RollbackFailedError("Could not restore " + firstFailure + " from backup", failureDetails);
    }
}

void BackupManager::discard(BackupSet&& backup) const
{
    for (const auto& entry : backup.entries_)
    {
        std::error_code ec;
        fs::remove_all(entry.backup, ec);
        if (ec)
        {
            PLOG_WARNING << "Failed to cleanup backup " << entry.backup.string() << ": " << ec.message();
        }
        else
        {
            PLOG_INFO << "Backup cleaned up: " << entry.backup.string();
        }
    }
    backup.entries_.clear();
}

} // namespace updater
