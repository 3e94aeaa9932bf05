#include "UpdaterConfig.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace updater
{

namespace
{

void readString(const toml::table& table, const char* key, std::string& out)
{
    if (auto value = table[key].value<std::string>())
    {
        if (value->empty())
        {
            PLOG_WARNING << "Config key " << key << " is empty; keeping '" << out << "'";
            return;
        }
        out = *value;
    }
}

void readPositive(const toml::table& table, const char* key, std::int64_t& out)
{
    if (auto value = table[key].value<std::int64_t>())
    {
        if (*value <= 0)
        {
            PLOG_WARNING << "Config key " << key << " must be positive (got " << *value << "); keeping " << out;
            return;
        }
        out = *value;
    }
}

void readBool(const toml::table& table, const char* key, bool& out)
{
    if (auto value = table[key].value<bool>())
    {
        out = *value;
    }
}

} // namespace

UpdaterConfig::UpdaterConfig(fs::path path)
    : path_(std::move(path))
{
}

bool UpdaterConfig::load(UpdaterSettings& settings)
{
    lastError_.clear();
    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_DEBUG << "No config at " << path_.string() << ", using defaults";
        return true;
    }

    try
    {
        toml::table root = toml::parse(ifs, path_.string());
        const toml::table* section = root["updater"].as_table();
        if (!section)
        {
            PLOG_DEBUG << "Config has no [updater] table, using defaults";
            return true;
        }

        const toml::table& t = *section;
        readString(t, "repository", settings.repository);
        readString(t, "api_base_url", settings.apiBaseUrl);
        if (auto prefix = t["product_prefix"].value<std::string>())
        {
            settings.productPrefix = *prefix; // Empty disables prefix stripping
        }
        readString(t, "executable_name", settings.executableName);
        readString(t, "support_dir_name", settings.supportDirName);
        readString(t, "state_file_name", settings.stateFileName);
        readString(t, "shortcut_name", settings.shortcutName);
        readString(t, "success_marker_name", settings.successMarkerName);
        readString(t, "lock_file_name", settings.lockFileName);
        readString(t, "backup_suffix", settings.backupSuffix);
        readString(t, "platform", settings.platform);
        readString(t, "asset_size_preference", settings.assetSizePreference);
        readPositive(t, "request_timeout_seconds", settings.requestTimeoutSeconds);
        readPositive(t, "download_timeout_seconds", settings.downloadTimeoutSeconds);
        readPositive(t, "exit_wait_attempts", settings.exitWaitAttempts);
        readPositive(t, "exit_wait_interval_ms", settings.exitWaitIntervalMs);
        readBool(t, "abort_on_lingering_process", settings.abortOnLingeringProcess);
        readPositive(t, "stale_lock_minutes", settings.staleLockMinutes);
        readBool(t, "auto_update_enabled", settings.autoUpdateEnabled);
        readString(t, "check_frequency", settings.checkFrequency);
        if (auto last = t["last_update_check"].value<std::int64_t>())
        {
            settings.lastUpdateCheck = *last < 0 ? 0 : *last;
        }

        PLOG_INFO << "Loaded updater config from " << path_.string();
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        lastError_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << lastError_;

        std::string details = std::string(pe.description());
        if (pe.source().begin.line > 0)
        {
            details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + details;
        }
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Updater configuration has errors. Using defaults.",
                                            details + "\nFile: " + path_.string());
        settings = UpdaterSettings{};
        return false;
    }
}

bool UpdaterConfig::saveLastCheck(std::chrono::system_clock::time_point when)
{
    lastError_.clear();

    toml::table root;
    {
        std::ifstream ifs(path_, std::ios::binary);
        if (ifs)
        {
            try
            {
                root = toml::parse(ifs, path_.string());
            }
            catch (const toml::parse_error& pe)
            {
                lastError_ = "Refusing to overwrite unparseable config: " + std::string(pe.description());
                PLOG_WARNING << lastError_;
                return false;
            }
        }
    }

    if (!root["updater"].as_table())
    {
        root.insert_or_assign("updater", toml::table{});
    }
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(when.time_since_epoch()).count();
    root["updater"].as_table()->insert_or_assign("last_update_check", static_cast<std::int64_t>(seconds));

    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            lastError_ = "Could not create temporary file for writing: " + tmp.string();
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              lastError_);
            return false;
        }
        ofs << root << '\n';
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec)
    {
        lastError_ = std::string("Failed to rename: ") + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          "Could not rename temporary file: " + ec.message());
        fs::remove(tmp, ec);
        return false;
    }

    PLOG_DEBUG << "Recorded update check time " << seconds << " in " << path_.string();
    return true;
}

} // namespace updater
