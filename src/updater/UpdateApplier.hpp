#pragma once

#include "BackupManager.hpp"
#include "UpdateTypes.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace updater
{

class IPlatformServices;

// Copies one file or directory tree, throwing on failure
using PathCopier = std::function<void(const std::filesystem::path& from, const std::filesystem::path& to)>;

struct ApplierOptions
{
    std::string shortcutName = "Cabplanner.lnk";
    std::string successMarkerName = ".update_success";
    std::string backupSuffix = ".bak";
    bool relaunch = true;
};

// Replaces the live executable and support directory with a staged package.
// The persisted-state file of the live installation is never touched.
class UpdateApplier
{
public:
    UpdateApplier(InstallationLayout live, ApplierOptions options, IPlatformServices& platform);
    ~UpdateApplier() = default;

    // Installs the package whose layout root is packageRoot.
    //   LayoutError          package state file could not be removed (live install untouched)
    //   SwapError            new files could not be put in place; the previous
    //                        executable and support directory were restored
    //   RollbackFailedError  restoring the backup failed; manual intervention needed
    void applyUpdate(const std::filesystem::path& packageRoot);

    void setCopier(PathCopier copier) { copier_ = std::move(copier); }

    const InstallationLayout& liveLayout() const { return live_; }

    std::filesystem::path successMarkerPath() const { return live_.root / options_.successMarkerName; }

    // True (and the marker is deleted) when an update completed since the last call
    static bool consumeSuccessMarker(const std::filesystem::path& installDir, const std::string& markerName);

    static void copyPath(const std::filesystem::path& from, const std::filesystem::path& to);

private:
    void removeStagedStateFile(const InstallationLayout& package) const;
    void installFiles(const InstallationLayout& package) const;
    void finalize(BackupSet&& backup);
    void writeSuccessMarker() const;

    InstallationLayout live_;
    ApplierOptions options_;
    IPlatformServices& platform_;
    BackupManager backups_;
    PathCopier copier_;
};

} // namespace updater
