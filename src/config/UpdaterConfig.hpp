#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace updater
{

// [updater] table of updater.toml
struct UpdaterSettings
{
    std::string repository = "bmruszaj/cabplanner";
    std::string apiBaseUrl = "https://api.github.com";
    std::string productPrefix = "cabplanner-";
    std::string executableName = "cabplanner.exe";
    std::string supportDirName = "_internal";
    std::string stateFileName = "cabplanner.db";
    std::string shortcutName = "Cabplanner.lnk";
    std::string successMarkerName = ".update_success";
    std::string lockFileName = ".update.lock";
    std::string backupSuffix = ".bak";
    std::string platform = "windows";
    std::string assetSizePreference = "larger";
    std::int64_t requestTimeoutSeconds = 10;
    std::int64_t downloadTimeoutSeconds = 300;
    std::int64_t exitWaitAttempts = 15;
    std::int64_t exitWaitIntervalMs = 1000;
    bool abortOnLingeringProcess = false;
    std::int64_t staleLockMinutes = 30;
    bool autoUpdateEnabled = true;
    std::string checkFrequency = "weekly";
    std::int64_t lastUpdateCheck = 0; // Unix seconds, 0 = never
};

class UpdaterConfig
{
public:
    explicit UpdaterConfig(std::filesystem::path path);

    // Missing file: defaults, returns true. Parse error: defaults, returns false
    // and lastError() describes the problem. Invalid values keep their default.
    bool load(UpdaterSettings& settings);

    // Rewrites last_update_check only, preserving the rest of the document
    bool saveLastCheck(std::chrono::system_clock::time_point when);

    const std::filesystem::path& path() const { return path_; }

    const std::string& lastError() const { return lastError_; }

private:
    std::filesystem::path path_;
    std::string lastError_;
};

} // namespace updater
