#include "ProcessDetector.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>

#ifdef _WIN32
#include <windows.h>
#include <tlhelp32.h>
#include <cwctype>
#else
#include <fstream>
#include <unistd.h>
#endif

namespace
{

// A failing scan is reported once per run, later failures only return "not running"
std::atomic<bool> g_scan_failure_reported{ false };

void reportScanFailure(const std::string& details)
{
    if (!g_scan_failure_reported.exchange(true))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Platform,
                                            "Could not check whether the application is still running", details);
    }
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

#ifdef _WIN32
std::vector<ProcessDetector::ProcessEntry> scanProcesses(const std::string& executableName)
{
    std::vector<ProcessDetector::ProcessEntry> found;

    HANDLE snapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snapshot == INVALID_HANDLE_VALUE)
    {
        reportScanFailure("CreateToolhelp32Snapshot error " + std::to_string(GetLastError()));
        return found;
    }

    PROCESSENTRY32W entry{};
    entry.dwSize = sizeof(entry);
    if (!Process32FirstW(snapshot, &entry))
    {
        const DWORD err = GetLastError();
        CloseHandle(snapshot);
        reportScanFailure("Process32FirstW error " + std::to_string(err));
        return found;
    }

    const std::wstring target = std::filesystem::path(toLower(executableName)).wstring();
    const DWORD self = GetCurrentProcessId();
    do
    {
        std::wstring image = entry.szExeFile;
        std::transform(image.begin(), image.end(), image.begin(), [](wchar_t c) { return std::towlower(c); });
        if (image == target && entry.th32ProcessID != self)
        {
            found.push_back({ static_cast<std::uint32_t>(entry.th32ProcessID), executableName });
        }
    } while (Process32NextW(snapshot, &entry));

    CloseHandle(snapshot);
    return found;
}
#else
constexpr size_t kCommLength = 15;

std::vector<ProcessDetector::ProcessEntry> scanProcesses(const std::string& executableName)
{
    std::vector<ProcessDetector::ProcessEntry> found;

    const std::filesystem::path procDir("/proc");
    std::error_code ec;
    if (!std::filesystem::is_directory(procDir, ec))
    {
        reportScanFailure("/proc is not available");
        return found;
    }

    const std::string fullName = executableName.substr(0, kCommLength);
    const std::string stemName = std::filesystem::path(executableName).stem().string().substr(0, kCommLength);
    const auto self = static_cast<std::uint32_t>(getpid());

    for (std::filesystem::directory_iterator it(procDir, ec), end; !ec && it != end; it.increment(ec))
    {
        const std::string pidText = it->path().filename().string();
        if (pidText.empty() || !std::all_of(pidText.begin(), pidText.end(), ::isdigit))
            continue;

        std::ifstream comm(it->path() / "comm");
        std::string comm_name;
        if (!comm.is_open() || !std::getline(comm, comm_name))
            continue;

        if (comm_name != fullName && comm_name != stemName)
            continue;

        const auto pid = static_cast<std::uint32_t>(std::stoul(pidText));
        if (pid != self)
        {
            found.push_back({ pid, comm_name });
        }
    }
    return found;
}
#endif

} // namespace

std::vector<ProcessDetector::ProcessEntry> ProcessDetector::findInstances(const std::string& executableName)
{
    if (executableName.empty())
        return {};

    auto instances = scanProcesses(executableName);
    for (const auto& instance : instances)
    {
        PLOG_DEBUG << "Found running " << instance.name << " (pid " << instance.pid << ")";
    }
    return instances;
}
