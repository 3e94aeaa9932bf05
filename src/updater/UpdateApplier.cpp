#include "UpdateApplier.hpp"
#include "UpdateErrors.hpp"
#include "../platform/PlatformServices.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace updater
{

UpdateApplier::UpdateApplier(InstallationLayout live, ApplierOptions options, IPlatformServices& platform)
    : live_(std::move(live))
    , options_(std::move(options))
    , platform_(platform)
    , backups_(options_.backupSuffix)
    , copier_(&UpdateApplier::copyPath)
{
}

void UpdateApplier::applyUpdate(const fs::path& packageRoot)
{
    InstallationLayout package = live_;
    package.root = packageRoot;

    PLOG_INFO << "Installing package from " << packageRoot.string() << " into " << live_.root.string();

    removeStagedStateFile(package);

    BackupSet backup = backups_.moveAside({ live_.executable(), live_.supportDir() });

    try
    {
        installFiles(package);
    }
    catch (const std::exception& e)
    {
        PLOG_ERROR << "Installing new files failed: " << e.what();
        PLOG_WARNING << "Rolling back to the previous installation";
        backups_.restore(std::move(backup));
        PLOG_INFO << "Rollback complete, previous installation restored";
        throw SwapError("Failed to install the new version; the previous version was restored", e.what());
    }

    finalize(std::move(backup));
}

void UpdateApplier::removeStagedStateFile(const InstallationLayout& package) const
{
    const fs::path staged = package.stateFile();
    std::error_code ec;
    if (!fs::exists(staged, ec))
        return;

    PLOG_WARNING << "Package ships its own " << live_.stateFileName << "; removing it before install";
    fs::remove_all(staged, ec);
    if (ec)
    {
        throw LayoutError("Package contains a state file that could not be removed",
                          staged.string() + ": " + ec.message());
    }
}

void UpdateApplier::installFiles(const InstallationLayout& package) const
{
    copier_(package.executable(), live_.executable());
    PLOG_INFO << "Installed " << live_.executable().string();

    copier_(package.supportDir(), live_.supportDir());
    PLOG_INFO << "Installed " << live_.supportDir().string();
}

void UpdateApplier::finalize(BackupSet&& backup)
{
    // A fresh install (no state file yet) gets its shortcut rewritten
    const fs::path shortcut = live_.root / options_.shortcutName;
    std::error_code ec;
    if (!fs::exists(live_.stateFile(), ec))
    {
        if (!platform_.refreshShortcut(live_.executable(), shortcut))
        {
            PLOG_WARNING << "Could not refresh shortcut " << shortcut.string();
        }
    }
    else if (!platform_.shortcutExists(shortcut))
    {
        if (!platform_.ensureShortcut(live_.executable(), shortcut))
        {
            PLOG_WARNING << "Could not create shortcut " << shortcut.string();
        }
    }

    writeSuccessMarker();
    backups_.discard(std::move(backup));

    if (!options_.relaunch)
        return;

    if (platform_.launch(live_.executable(), {}, live_.root))
    {
        PLOG_INFO << "Relaunched " << live_.executable().string();
    }
    else
    {
        PLOG_WARNING << "Update installed but the application could not be relaunched";
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Platform,
                                            "Update installed. Start the application manually.",
                                            live_.executable().string());
    }
}

void UpdateApplier::writeSuccessMarker() const
{
    const fs::path marker = successMarkerPath();
    std::ofstream out(marker, std::ios::out | std::ios::trunc);
    if (!out.is_open())
    {
        PLOG_WARNING << "Could not write success marker " << marker.string();
        return;
    }
    out << utils::ErrorReporter::GetTimestamp() << '\n';
    PLOG_INFO << "Success marker written: " << marker.string();
}

bool UpdateApplier::consumeSuccessMarker(const fs::path& installDir, const std::string& markerName)
{
    const fs::path marker = installDir / markerName;
    std::error_code ec;
    if (!fs::exists(marker, ec))
        return false;

    fs::remove(marker, ec);
    if (ec)
    {
        PLOG_WARNING << "Could not remove update success marker: " << ec.message();
    }
    else
    {
        PLOG_INFO << "Removed update success marker";
    }
    return true;
}

void UpdateApplier::copyPath(const fs::path& from, const fs::path& to)
{
    if (fs::is_directory(from))
    {
        fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
    }
    else
    {
        fs::copy_file(from, to, fs::copy_options::overwrite_existing);
    }
}

} // namespace updater
