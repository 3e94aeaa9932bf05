#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// [logging] table of updater.toml
struct LogSettings
{
    bool append = true; // false truncates the log at startup
    plog::Severity level = plog::info;
};

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::filesystem::path filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        int backup_count = 3;
        bool add_console_appender = false;
    };

    // Defaults when configPath is empty, missing or has no [logging] table.
    // A level outside 0..6 keeps the default; a parse error is reported as a warning.
    static LogSettings ReadSettings(const std::filesystem::path& configPath);

    // Creates logDir; later calls are no-ops until Shutdown()
    static bool Initialize(const std::filesystem::path& logDir, const LogSettings& settings);

    // The first registration of an instance fixes its appenders for the rest of
    // the process; registering it again after Shutdown() only restores its level
    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    // Mutes the default logger. Appenders are released at process exit.
    static void Shutdown();

    static const LogSettings& Settings();
    static const std::filesystem::path& GetLogDirectory();

private:
    LogManager() = default;

    static bool s_initialized;
    static LogSettings s_settings;
    static std::filesystem::path s_log_dir;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
