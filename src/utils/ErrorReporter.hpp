#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, CLI, lock acquisition
    Configuration,  // updater.toml parsing, invalid values
    Network,        // release metadata and package transfer
    Package,        // checksum, archive safety, extraction
    Installation,   // layout probe, swap, rollback
    Platform,       // process scan, shortcuts, relaunch
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // The run continues in a degraded way
    Error,   // The update attempt failed, the installation is intact
    Fatal    // The installation may be left inconsistent
};

struct ErrorReport
{
    ErrorCategory category;
    ErrorSeverity severity;
    std::string user_message;      // Actionable text printed by the CLI
    std::string technical_details; // Paths, error codes, library messages
    std::string timestamp;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Problems collected during one updater run
 *
 * Every report is logged through plog when it is made and queued until the CLI
 * prints the summary on exit. A rollback that could not restore the previous
 * installation is the one Fatal report:
 *
 *   ErrorReporter::ReportFatal(ErrorCategory::Installation,
 *                              "Reinstall the application manually.",
 *                              "backup: C:/Cabplanner/cabplanner.exe.bak");
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    // Drains the queue
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

    // "[Severity] Category: message (details)"
    static std::string FormatReport(const ErrorReport& report);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    // Local time, "YYYY-MM-DD HH:MM:SS"
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
