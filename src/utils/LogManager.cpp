#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <cstdint>
#include <fstream>
#include <system_error>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace fs = std::filesystem;

namespace utils
{

bool LogManager::s_initialized = false;
LogSettings LogManager::s_settings;
fs::path LogManager::s_log_dir = "logs";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

LogSettings LogManager::ReadSettings(const fs::path& configPath)
{
    LogSettings settings;

    std::error_code ec;
    if (configPath.empty() || !fs::is_regular_file(configPath, ec))
        return settings;

    try
    {
        const toml::table cfg = toml::parse_file(configPath.string());
        const toml::table* logging = cfg["logging"].as_table();
        if (!logging)
            return settings;

        if (auto append = (*logging)["append"].value<bool>())
        {
            settings.append = *append;
        }
        if (auto level = (*logging)["level"].value<std::int64_t>())
        {
            if (*level >= plog::none && *level <= plog::verbose)
            {
                settings.level = static_cast<plog::Severity>(*level);
            }
        }
    }
    catch (const toml::parse_error& e)
    {
        // No logger exists yet, so the problem is only queued for the CLI summary
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored",
                                     std::string(e.description()) + "\nFile: " + configPath.string());
    }
    return settings;
}

bool LogManager::Initialize(const fs::path& logDir, const LogSettings& settings)
{
    if (s_initialized)
        return true;

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     logDir.string() + ": " + ec.message());
        return false;
    }

    s_log_dir = logDir;
    s_settings = settings;
    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logging is not initialized", config.name);
        return false;
    }

    const plog::Severity level = config.level_override.value_or(s_settings.level);

    // plog holds its appenders by raw pointer for the life of the process, so an
    // instance registered before Shutdown() is unmuted instead of rebuilt
    if (auto* existing = plog::get<InstanceId>())
    {
        existing->setMaxSeverity(level);
        PLOG_INFO_(InstanceId) << "---- " << config.name << " log reopened ----";
        return true;
    }

    try
    {
        if (!config.append_override.value_or(s_settings.append))
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.string().c_str(), config.max_file_size, config.backup_count);
        plog::init<InstanceId>(level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            plog::get<InstanceId>()->addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        PLOG_INFO_(InstanceId) << "---- " << config.name << " log opened ----";
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Could not open the " + config.name + " log",
                                   config.filepath.string() + ": " + ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

void LogManager::Shutdown()
{
    // Appenders stay owned by s_appenders until exit; the logger only stops writing
    if (auto* logger = plog::get<0>())
    {
        logger->setMaxSeverity(plog::none);
    }
    s_initialized = false;
}

const LogSettings& LogManager::Settings() { return s_settings; }

const fs::path& LogManager::GetLogDirectory() { return s_log_dir; }

} // namespace utils
