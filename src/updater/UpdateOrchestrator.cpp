#include "UpdateOrchestrator.hpp"
#include "LayoutProbe.hpp"
#include "ReleaseSource.hpp"
#include "UpdateErrors.hpp"
#include "UpdateLock.hpp"
#include "../platform/PlatformServices.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/ZipExtractor.hpp"

#include <plog/Log.h>

#include <atomic>
#include <mutex>
#include <system_error>
#include <variant>

namespace fs = std::filesystem;

namespace updater
{

namespace
{

// Private working directory for one attempt; removed best-effort on destruction
class StagingArea
{
public:
    StagingArea(const fs::path& tempRoot, const std::string& prefix)
    {
        const fs::path base = tempRoot.empty() ? fs::temp_directory_path() : tempRoot;
        const auto seed = std::chrono::system_clock::now().time_since_epoch().count();
        fs::create_directories(base);
        for (int attempt = 0; attempt < 100; ++attempt)
        {
            fs::path candidate = base / (prefix + std::to_string(seed) + "_" + std::to_string(attempt));
            // create_directory returns false when the path already exists
            if (fs::create_directory(candidate))
            {
                root_ = candidate;
                break;
            }
        }
        if (root_.empty())
        {
            throw UpdateException(UpdateErrorKind::Unknown, "Could not create a temporary directory", base.string());
        }
        std::error_code ec;
        fs::permissions(root_, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec)
        {
            PLOG_WARNING << "Could not restrict staging directory permissions: " << ec.message();
        }
        fs::create_directory(downloadDir());
        PLOG_DEBUG << "Staging directory: " << root_.string();
    }

    ~StagingArea()
    {
        std::error_code ec;
        fs::remove_all(root_, ec);
        if (ec)
        {
            PLOG_WARNING << "Failed to remove temporary directory " << root_.string() << ": " << ec.message();
        }
        else
        {
            PLOG_DEBUG << "Temporary directory removed: " << root_.string();
        }
    }

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    fs::path downloadDir() const { return root_ / "download"; }

    fs::path extractDir() const { return root_ / "extracted"; }

private:
    fs::path root_;
};

// One alternative per phase, each carrying what the phase needs
struct CheckingPhase
{
};

struct DownloadingPhase
{
    ReleaseDescriptor release;
    std::string latestVersion;
};

struct VerifyingPhase
{
    AssetDescriptor asset;
    fs::path archivePath;
};

struct StagingPhase
{
    fs::path packageRoot;
};

struct SwappingPhase
{
    fs::path packageRoot;
};

struct FinishedPhase
{
    UpdateState state;
    UpdateError error;
};

using Phase = std::variant<CheckingPhase, DownloadingPhase, VerifyingPhase, StagingPhase, SwappingPhase, FinishedPhase>;

UpdateError toUpdateError(const UpdateException& e)
{
    return UpdateError(e.what(), e.details(), static_cast<int>(e.kind()));
}

utils::ErrorCategory categoryFor(UpdateErrorKind kind)
{
    switch (kind)
    {
    case UpdateErrorKind::Network:
    case UpdateErrorKind::MalformedResponse:
        return utils::ErrorCategory::Network;
    case UpdateErrorKind::InvalidVersion:
        return utils::ErrorCategory::Configuration;
    case UpdateErrorKind::NoSuitableAsset:
    case UpdateErrorKind::DownloadIncomplete:
    case UpdateErrorKind::ChecksumMismatch:
    case UpdateErrorKind::UnsafeArchive:
    case UpdateErrorKind::CorruptArchive:
        return utils::ErrorCategory::Package;
    case UpdateErrorKind::Layout:
    case UpdateErrorKind::Swap:
    case UpdateErrorKind::RollbackFailed:
    case UpdateErrorKind::NotPackaged:
        return utils::ErrorCategory::Installation;
    case UpdateErrorKind::UpdateInProgress:
        return utils::ErrorCategory::Initialization;
    default:
        return utils::ErrorCategory::Unknown;
    }
}

} // namespace

struct UpdateOrchestrator::Impl
{
    InstallationLayout live;
    std::string currentVersion;
    OrchestratorOptions options;
    IReleaseSource& releases;
    IPackageDownloader& downloader;
    IPlatformServices& platform;
    UpdateApplier applier;

    std::atomic<UpdateState> state{ UpdateState::Idle };
    std::atomic<bool> cancelled{ false };

    mutable std::mutex infoMutex;
    DownloadProgress downloadProgress;
    StateCallback stateCallback;
    PackageProgressCallback progressCallback;

    // Per-run data
    std::unique_ptr<StagingArea> staging;
    UpdateOutcome outcome;

    Impl(InstallationLayout layout, std::string version, OrchestratorOptions opts, IReleaseSource& source,
         IPackageDownloader& packageDownloader, IPlatformServices& services)
        : live(std::move(layout))
        , currentVersion(std::move(version))
        , options(std::move(opts))
        , releases(source)
        , downloader(packageDownloader)
        , platform(services)
        , applier(live, options.applier, services)
    {
    }

    void setState(UpdateState next)
    {
        state = next;
        PLOG_INFO << "Update state: " << toString(next);
        StateCallback callback;
        {
            std::lock_guard<std::mutex> lock(infoMutex);
            callback = stateCallback;
        }
        if (callback)
        {
            callback(next);
        }
    }

    void throwIfCancelled(const char* phase) const
    {
        if (cancelled)
        {
            throw UpdateCancelledError("Update cancelled", std::string("cancelled before ") + phase);
        }
    }

    UpdateCheckResult check()
    {
        UpdateCheckResult result;
        result.currentVersion = currentVersion;

        PLOG_INFO << "Checking " << options.repository << " for updates (current version: " << currentVersion << ")";
        result.release = releases.fetchLatest(options.repository);
        result.latestVersion = Version::normalizeTag(result.release.tagName, options.productPrefix);
        result.updateAvailable = isNewerVersion(currentVersion, result.release.tagName, options.productPrefix);

        if (result.updateAvailable)
        {
            PLOG_INFO << "Update available: " << currentVersion << " -> " << result.latestVersion;
        }
        else
        {
            PLOG_INFO << "No newer version (latest: " << result.latestVersion << ")";
        }
        return result;
    }

    Phase step(CheckingPhase&)
    {
        throwIfCancelled("checking");
        setState(UpdateState::Checking);

        UpdateCheckResult result = check();
        outcome.latestVersion = result.latestVersion;
        if (!result.updateAvailable)
        {
            return FinishedPhase{ UpdateState::Idle, {} };
        }
        return DownloadingPhase{ std::move(result.release), result.latestVersion };
    }

    Phase step(DownloadingPhase& phase)
    {
        throwIfCancelled("downloading");
        setState(UpdateState::Downloading);

        AssetSelector selector(options.assetPolicy);
        const AssetDescriptor asset = selector.select(phase.release.assets);
        outcome.assetName = asset.name;

        staging = std::make_unique<StagingArea>(options.tempRoot, options.tempPrefix);

        fs::path fileName = fs::path(asset.name).filename();
        if (fileName.empty())
        {
            fileName = "package.zip";
        }
        const fs::path archivePath = staging->downloadDir() / fileName;

        PLOG_INFO << "Downloading " << asset.name << " (" << asset.size << " bytes)";
        downloader.download(
            asset, archivePath,
            [this](const DownloadProgress& progress)
            {
                PackageProgressCallback callback;
                {
                    std::lock_guard<std::mutex> lock(infoMutex);
                    downloadProgress = progress;
                    callback = progressCallback;
                }
                if (callback)
                {
                    callback(progress);
                }
            },
            cancelled);

        return VerifyingPhase{ asset, archivePath };
    }

    Phase step(VerifyingPhase& phase)
    {
        throwIfCancelled("verifying");
        setState(UpdateState::Verifying);

        const fs::path extractDir = staging->extractDir();
        const size_t files = utils::ZipExtractor::ExtractZip(phase.archivePath, extractDir);
        PLOG_INFO << "Extracted " << files << " files from " << phase.asset.name;

        auto root = LayoutProbe::findExecutableRoot(extractDir, live.executableName);
        if (!root)
        {
            throw LayoutError("The downloaded package does not contain " + live.executableName, phase.asset.name);
        }

        InstallationLayout package = live;
        package.root = *root;
        if (!LayoutProbe::verifyLayout(package))
        {
            throw LayoutError("The downloaded package is incomplete",
                              "expected " + live.executableName + " and " + live.supportDirName + "/ under " +
                                  root->string());
        }

        return StagingPhase{ *root };
    }

    Phase step(StagingPhase& phase)
    {
        setState(UpdateState::Staging);
        waitForApplicationExit();
        return SwappingPhase{ phase.packageRoot };
    }

    Phase step(SwappingPhase& phase)
    {
        setState(UpdateState::Swapping);
        try
        {
            applier.applyUpdate(phase.packageRoot);
        }
        catch (const SwapError& e)
        {
            return FinishedPhase{ UpdateState::RolledBack, toUpdateError(e) };
        }
        PLOG_INFO << "Update to " << outcome.latestVersion << " installed";
        return FinishedPhase{ UpdateState::Succeeded, {} };
    }

    Phase step(FinishedPhase& phase) { return phase; }

    void waitForApplicationExit()
    {
        for (int attempt = 1; attempt <= options.exitWaitAttempts; ++attempt)
        {
            if (!platform.isProcessRunning(live.executableName))
            {
                PLOG_INFO << "Application is not running, continuing";
                return;
            }
            PLOG_INFO << "Waiting for " << live.executableName << " to exit (attempt " << attempt << "/"
                      << options.exitWaitAttempts << ")";
            platform.sleepFor(options.exitWaitInterval);
        }

        if (!platform.isProcessRunning(live.executableName))
            return;

        if (options.abortOnLingeringProcess)
        {
            throw UpdateException(UpdateErrorKind::Swap, "The application is still running; close it and retry",
                                  live.executableName + " did not exit after " +
                                      std::to_string(options.exitWaitAttempts) + " attempts");
        }
        PLOG_WARNING << live.executableName << " is still running after " << options.exitWaitAttempts
                     << " attempts; replacing files that may still be in use";
    }

    FinishedPhase fail(const UpdateError& error, UpdateErrorKind kind)
    {
        if (kind == UpdateErrorKind::Cancelled)
        {
            PLOG_INFO << "Update cancelled";
        }
        else if (kind != UpdateErrorKind::RollbackFailed)
        {
            // A failed rollback has already been reported as fatal
            utils::ErrorReporter::ReportError(categoryFor(kind), error.message, error.technicalInfo);
        }
        return FinishedPhase{ UpdateState::Failed, error };
    }

    FinishedPhase drive()
    {
        Phase phase = CheckingPhase{};
        while (!std::holds_alternative<FinishedPhase>(phase))
        {
            try
            {
                phase = std::visit([this](auto& current) -> Phase { return step(current); }, phase);
            }
            catch (const UpdateException& e)
            {
                PLOG_ERROR << "Update failed (" << toString(e.kind()) << "): " << e.what()
                           << (e.details().empty() ? "" : " | " + e.details());
                return fail(toUpdateError(e), e.kind());
            }
            catch (const std::exception& e)
            {
                PLOG_ERROR << "Update failed: " << e.what();
                return fail(UpdateError("Update failed", e.what(), static_cast<int>(UpdateErrorKind::Unknown)),
                            UpdateErrorKind::Unknown);
            }
        }
        return std::get<FinishedPhase>(phase);
    }
};

UpdateOrchestrator::UpdateOrchestrator(InstallationLayout live, std::string currentVersion,
                                       OrchestratorOptions options, IReleaseSource& releases,
                                       IPackageDownloader& downloader, IPlatformServices& platform)
    : impl_(std::make_unique<Impl>(std::move(live), std::move(currentVersion), std::move(options), releases,
                                   downloader, platform))
{
}

UpdateOrchestrator::~UpdateOrchestrator() = default;

UpdateCheckResult UpdateOrchestrator::checkForUpdate()
{
    impl_->setState(UpdateState::Checking);
    try
    {
        UpdateCheckResult result = impl_->check();
        impl_->setState(UpdateState::Idle);
        return result;
    }
    catch (const UpdateException&)
    {
        impl_->setState(UpdateState::Failed);
        throw;
    }
}

UpdateOutcome UpdateOrchestrator::run()
{
    impl_->cancelled = false;
    impl_->outcome = UpdateOutcome{};
    impl_->outcome.currentVersion = impl_->currentVersion;

    FinishedPhase finished{ UpdateState::Failed, {} };
    try
    {
        if (!LayoutProbe::verifyLayout(impl_->live))
        {
            throw NotPackagedError("Updates are only available for installed builds",
                                   impl_->live.root.string() + " is not a packaged installation");
        }

        auto lock = UpdateLock::Acquire(impl_->live.root / impl_->options.lockFileName, impl_->options.staleLockAfter);
        finished = impl_->drive();
        impl_->staging.reset();
    }
    catch (const UpdateException& e)
    {
        PLOG_ERROR << "Update not started: " << e.what() << (e.details().empty() ? "" : " | " + e.details());
        finished = impl_->fail(toUpdateError(e), e.kind());
    }

    impl_->outcome.state = finished.state;
    impl_->outcome.error = finished.error;
    impl_->setState(finished.state);
    return impl_->outcome;
}

void UpdateOrchestrator::cancel()
{
    PLOG_INFO << "Update cancellation requested";
    impl_->cancelled = true;
}

UpdateState UpdateOrchestrator::state() const
{
    return impl_->state;
}

DownloadProgress UpdateOrchestrator::downloadProgress() const
{
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    return impl_->downloadProgress;
}

void UpdateOrchestrator::setStateCallback(StateCallback callback)
{
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    impl_->stateCallback = std::move(callback);
}

void UpdateOrchestrator::setProgressCallback(PackageProgressCallback callback)
{
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    impl_->progressCallback = std::move(callback);
}

void UpdateOrchestrator::setCopier(PathCopier copier)
{
    impl_->applier.setCopier(std::move(copier));
}

} // namespace updater
