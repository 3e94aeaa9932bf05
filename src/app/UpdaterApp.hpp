#pragma once

#include "../config/UpdaterConfig.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace updater
{
struct InstallationLayout;
struct OrchestratorOptions;
} // namespace updater

// cabplanner-updater command-line front end
class UpdaterApp
{
public:
    struct Arguments
    {
        std::string command;
        bool scheduled = false;
        std::filesystem::path installDir;
        std::filesystem::path configPath;
        std::string currentVersion;
    };

    UpdaterApp(int argc, char** argv);
    ~UpdaterApp() = default;

    int run();

    // args excludes the program name
    static bool parseArguments(const std::vector<std::string>& args, Arguments& out, std::string& outError);

    static updater::InstallationLayout layoutFor(const std::filesystem::path& installDir,
                                                 const updater::UpdaterSettings& settings);
    static updater::OrchestratorOptions optionsFor(const updater::UpdaterSettings& settings);

    // --current-version, else <install>/<support>/.version, else <install>/.version
    static std::string resolveCurrentVersion(const Arguments& args, const updater::UpdaterSettings& settings);

private:
    bool initialize();
    bool initializeLogging();

    int runCheck();
    int runUpdate();
    int runShortcut();
    int runPostUpdate();
    int runVersion();

    static void printUsage();
    static void printPendingErrors();

    std::vector<std::string> rawArgs_;
    Arguments args_;
    updater::UpdaterSettings settings_;
};
