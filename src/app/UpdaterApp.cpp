#include "UpdaterApp.hpp"

#include "../platform/PlatformServices.hpp"
#include "../platform/ProcessUtils.hpp"
#include "../updater/AppVersion.hpp"
#include "../updater/GitHubReleaseChecker.hpp"
#include "../updater/PackageDownloader.hpp"
#include "../updater/UpdateApplier.hpp"
#include "../updater/UpdateErrors.hpp"
#include "../updater/UpdateOrchestrator.hpp"
#include "../updater/UpdateSchedule.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>

#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

UpdaterApp::UpdaterApp(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
    {
        rawArgs_.emplace_back(argv[i]);
    }
}

int UpdaterApp::run()
{
    std::string error;
    if (!parseArguments(rawArgs_, args_, error))
    {
        std::cerr << "cabplanner-updater: " << error << "\n\n";
        printUsage();
        return 1;
    }

    if (args_.command == "help")
    {
        printUsage();
        return 0;
    }

    if (!initialize())
    {
        printPendingErrors();
        return 1;
    }

    int exitCode = 1;
    if (args_.command == "check")
        exitCode = runCheck();
    else if (args_.command == "update")
        exitCode = runUpdate();
    else if (args_.command == "shortcut")
        exitCode = runShortcut();
    else if (args_.command == "post-update")
        exitCode = runPostUpdate();
    else if (args_.command == "version")
        exitCode = runVersion();

    printPendingErrors();
    PLOG_INFO << "cabplanner-updater " << args_.command << " finished with exit code " << exitCode;
    utils::LogManager::Shutdown();
    return exitCode;
}

bool UpdaterApp::parseArguments(const std::vector<std::string>& args, Arguments& out, std::string& outError)
{
    out = Arguments{};
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        auto takeValue = [&](std::string& value) -> bool
        {
            if (i + 1 >= args.size() || args[i + 1].empty())
            {
                outError = "missing value for " + arg;
                return false;
            }
            value = args[++i];
            return true;
        };

        if (arg == "--install-dir" || arg == "--config" || arg == "--current-version")
        {
            std::string value;
            if (!takeValue(value))
                return false;
            if (arg == "--install-dir")
                out.installDir = value;
            else if (arg == "--config")
                out.configPath = value;
            else
                out.currentVersion = value;
        }
        else if (arg == "--scheduled")
        {
            out.scheduled = true;
        }
        else if (arg == "-h" || arg == "--help")
        {
            out.command = "help";
            return true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            outError = "unknown option " + arg;
            return false;
        }
        else if (out.command.empty())
        {
            out.command = arg;
        }
        else
        {
            outError = "unexpected argument " + arg;
            return false;
        }
    }

    if (out.command.empty())
    {
        outError = "no command given";
        return false;
    }
    if (out.command != "check" && out.command != "update" && out.command != "shortcut" &&
        out.command != "post-update" && out.command != "version")
    {
        outError = "unknown command " + out.command;
        return false;
    }
    if (out.scheduled && out.command != "update")
    {
        outError = "--scheduled only applies to update";
        return false;
    }
    return true;
}

updater::InstallationLayout UpdaterApp::layoutFor(const fs::path& installDir, const updater::UpdaterSettings& settings)
{
    updater::InstallationLayout layout;
    layout.root = installDir;
    layout.executableName = settings.executableName;
    layout.supportDirName = settings.supportDirName;
    layout.stateFileName = settings.stateFileName;
    return layout;
}

updater::OrchestratorOptions UpdaterApp::optionsFor(const updater::UpdaterSettings& settings)
{
    updater::OrchestratorOptions options;
    options.repository = settings.repository;
    options.productPrefix = settings.productPrefix;
    options.assetPolicy = updater::AssetSelectionPolicy::forPlatform(settings.platform);

    updater::SizePreference preference = updater::SizePreference::Larger;
    if (updater::parseSizePreference(settings.assetSizePreference, preference))
    {
        options.assetPolicy.sizePreference = preference;
    }
    else
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Unknown asset size preference",
                                            "'" + settings.assetSizePreference + "', using larger");
    }

    options.applier.shortcutName = settings.shortcutName;
    options.applier.successMarkerName = settings.successMarkerName;
    options.applier.backupSuffix = settings.backupSuffix;
    options.lockFileName = settings.lockFileName;
    options.staleLockAfter = std::chrono::minutes{ settings.staleLockMinutes };
    options.exitWaitAttempts = static_cast<int>(settings.exitWaitAttempts);
    options.exitWaitInterval = std::chrono::milliseconds{ settings.exitWaitIntervalMs };
    options.abortOnLingeringProcess = settings.abortOnLingeringProcess;
    return options;
}

std::string UpdaterApp::resolveCurrentVersion(const Arguments& args, const updater::UpdaterSettings& settings)
{
    if (!args.currentVersion.empty())
        return args.currentVersion;

    std::error_code ec;
    const fs::path bundled = args.installDir / settings.supportDirName / ".version";
    if (fs::exists(bundled, ec))
        return updater::AppVersion::readVersionFile(bundled);

    return updater::AppVersion::readVersionFile(args.installDir / ".version");
}

bool UpdaterApp::initialize()
{
    if (args_.installDir.empty())
    {
        args_.installDir = utils::ProcessUtils::GetExecutablePath().parent_path();
        if (args_.installDir.empty())
        {
            args_.installDir = fs::current_path();
        }
    }
    std::error_code ec;
    const fs::path absolute = fs::absolute(args_.installDir, ec);
    if (!ec)
    {
        args_.installDir = absolute;
    }

    if (args_.configPath.empty())
    {
        args_.configPath = args_.installDir / "updater.toml";
    }

    if (!initializeLogging())
        return false;

    PLOG_INFO << "cabplanner-updater " << args_.command << " (install dir: " << args_.installDir.string() << ")";

    updater::UpdaterConfig config(args_.configPath);
    config.load(settings_);
    return true;
}

bool UpdaterApp::initializeLogging()
{
    const fs::path logDir = args_.installDir / "logs";
    if (!utils::LogManager::Initialize(logDir, utils::LogManager::ReadSettings(args_.configPath)))
        return false;

    return utils::LogManager::RegisterLogger<0>({ .name = "update", .filepath = logDir / "update.log" });
}

int UpdaterApp::runCheck()
{
    updater::GitHubReleaseChecker releases({}, settings_.apiBaseUrl,
                                           std::chrono::seconds{ settings_.requestTimeoutSeconds });
    updater::PackageDownloader downloader(std::chrono::seconds{ settings_.downloadTimeoutSeconds });
    updater::DesktopPlatform platform;
    updater::UpdateOrchestrator orchestrator(layoutFor(args_.installDir, settings_),
                                             resolveCurrentVersion(args_, settings_), optionsFor(settings_), releases,
                                             downloader, platform);
    try
    {
        const auto result = orchestrator.checkForUpdate();
        std::cout << result.currentVersion << " -> " << result.latestVersion << "\n";
        std::cout << (result.updateAvailable ? "Update available" : "Up to date") << "\n";
        return 0;
    }
    catch (const updater::UpdateException& e)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Network, "Could not check for updates",
                                          std::string(e.what()) + (e.details().empty() ? "" : ": " + e.details()));
        return 1;
    }
}

int UpdaterApp::runUpdate()
{
    if (args_.scheduled)
    {
        updater::UpdaterConfig config(args_.configPath);
        const auto last = std::chrono::system_clock::time_point{ std::chrono::seconds{ settings_.lastUpdateCheck } };
        const auto now = std::chrono::system_clock::now();
        if (!updater::UpdateSchedule::shouldCheck(settings_.autoUpdateEnabled,
                                                  updater::parseCheckFrequency(settings_.checkFrequency), last, now))
        {
            PLOG_INFO << "Skipping scheduled update check (" << settings_.checkFrequency << ")";
            std::cout << "Update check not due\n";
            return 0;
        }
        if (!config.saveLastCheck(now))
        {
            PLOG_WARNING << "Could not record update check time: " << config.lastError();
        }
    }

    updater::GitHubReleaseChecker releases({}, settings_.apiBaseUrl,
                                           std::chrono::seconds{ settings_.requestTimeoutSeconds });
    updater::PackageDownloader downloader(std::chrono::seconds{ settings_.downloadTimeoutSeconds });
    updater::DesktopPlatform platform;
    updater::UpdateOrchestrator orchestrator(layoutFor(args_.installDir, settings_),
                                             resolveCurrentVersion(args_, settings_), optionsFor(settings_), releases,
                                             downloader, platform);

    int lastPercent = -1;
    orchestrator.setProgressCallback(
        [&lastPercent](const updater::DownloadProgress& progress)
        {
            const int percent = static_cast<int>(progress.percentage);
            if (percent / 10 != lastPercent / 10)
            {
                lastPercent = percent;
                std::cout << "Downloading... " << percent << "% (" << progress.speed << ")\n";
            }
        });

    const auto outcome = orchestrator.run();
    switch (outcome.state)
    {
    case updater::UpdateState::Idle:
        std::cout << "Already up to date (" << outcome.currentVersion << ")\n";
        break;
    case updater::UpdateState::Succeeded:
        std::cout << "Updated " << outcome.currentVersion << " -> " << outcome.latestVersion << "\n";
        break;
    case updater::UpdateState::RolledBack:
        std::cout << "Update failed; the previous version was restored\n";
        break;
    default:
        std::cout << "Update failed: " << outcome.error.message << "\n";
        break;
    }
    return outcome.exitCode();
}

int UpdaterApp::runShortcut()
{
    updater::DesktopPlatform platform;
    const auto layout = layoutFor(args_.installDir, settings_);
    if (!platform.ensureShortcut(layout.executable(), layout.root / settings_.shortcutName))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Platform, "Could not create the desktop shortcut",
                                          layout.executable().string());
        return 1;
    }
    std::cout << "Shortcut ready\n";
    return 0;
}

int UpdaterApp::runPostUpdate()
{
    const bool updated = updater::UpdateApplier::consumeSuccessMarker(args_.installDir, settings_.successMarkerName);
    const std::string version = resolveCurrentVersion(args_, settings_);
    if (updated)
    {
        std::cout << "Update completed: now running " << updater::AppVersion::displayString(version) << "\n";
    }
    else
    {
        std::cout << "No update since last launch\n";
    }
    return 0;
}

int UpdaterApp::runVersion()
{
    std::cout << updater::AppVersion::displayString(resolveCurrentVersion(args_, settings_)) << "\n";
    return 0;
}

void UpdaterApp::printUsage()
{
    std::cout << "Usage: cabplanner-updater <command> [options]\n"
                 "\n"
                 "Commands:\n"
                 "  check                 Compare the installed version with the latest release\n"
                 "  update [--scheduled]  Download and install the latest release\n"
                 "  shortcut              Create the desktop shortcut if missing\n"
                 "  post-update           Report (once) that an update just completed\n"
                 "  version               Print the installed version\n"
                 "\n"
                 "Options:\n"
                 "  --install-dir DIR     Installation directory (default: updater location)\n"
                 "  --config FILE         Configuration file (default: <install-dir>/updater.toml)\n"
                 "  --current-version V   Override the installed version\n";
}

void UpdaterApp::printPendingErrors()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << utils::ErrorReporter::FormatReport(report) << "\n";
    }
}
