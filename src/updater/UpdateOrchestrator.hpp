#pragma once

#include "AssetSelector.hpp"
#include "PackageDownloader.hpp"
#include "UpdateApplier.hpp"
#include "UpdateTypes.hpp"
#include "Version.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace updater
{

class IReleaseSource;
class IPlatformServices;

using StateCallback = std::function<void(UpdateState)>;

struct OrchestratorOptions
{
    std::string repository = "bmruszaj/cabplanner";
    std::string productPrefix = kDefaultProductPrefix;
    AssetSelectionPolicy assetPolicy = AssetSelectionPolicy::forPlatform("windows");
    ApplierOptions applier;
    std::string lockFileName = ".update.lock";
    std::chrono::minutes staleLockAfter{ 30 };
    int exitWaitAttempts = 15;
    std::chrono::milliseconds exitWaitInterval{ 1000 };
    bool abortOnLingeringProcess = false;
    std::filesystem::path tempRoot; // Empty: the system temp directory
    std::string tempPrefix = "cabplanner_update_";
};

struct UpdateCheckResult
{
    std::string currentVersion;
    std::string latestVersion; // Normalized tag of the latest release
    ReleaseDescriptor release;
    bool updateAvailable = false;
};

// Result of one run(). state is Idle (nothing newer), Succeeded, RolledBack or Failed.
struct UpdateOutcome
{
    UpdateState state = UpdateState::Idle;
    std::string currentVersion;
    std::string latestVersion;
    std::string assetName;
    UpdateError error;

    // 0 on success or no-op, 1 on any failure (including a completed rollback)
    int exitCode() const { return (state == UpdateState::Succeeded || state == UpdateState::Idle) ? 0 : 1; }
};

// Drives Idle -> Checking -> Downloading -> Verifying -> Staging -> Swapping
// -> {Succeeded, RolledBack, Failed}. Single caller thread; cancel() may be
// called from any thread and is honored until the swap begins.
class UpdateOrchestrator
{
public:
    UpdateOrchestrator(InstallationLayout live, std::string currentVersion, OrchestratorOptions options,
                       IReleaseSource& releases, IPackageDownloader& downloader, IPlatformServices& platform);
    ~UpdateOrchestrator();

    UpdateOrchestrator(const UpdateOrchestrator&) = delete;
    UpdateOrchestrator& operator=(const UpdateOrchestrator&) = delete;

    // Queries the registry only. Throws NetworkError / MalformedResponseError.
    UpdateCheckResult checkForUpdate();

    // Runs the whole pipeline; never throws for update failures
    UpdateOutcome run();

    void cancel();

    UpdateState state() const;
    DownloadProgress downloadProgress() const;

    void setStateCallback(StateCallback callback);
    void setProgressCallback(PackageProgressCallback callback);

    // Replaces the copy step of the swap (used to inject failures)
    void setCopier(PathCopier copier);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updater
