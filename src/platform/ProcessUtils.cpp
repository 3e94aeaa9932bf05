#include "ProcessUtils.hpp"

#include <plog/Log.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace utils
{

fs::path ProcessUtils::GetExecutablePath()
{
#ifdef _WIN32
    std::wstring buffer(MAX_PATH, L'\0');
    for (;;)
    {
        const DWORD size = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (size == 0)
        {
            PLOG_ERROR << "GetModuleFileNameW failed: " << GetLastError();
            return {};
        }
        if (size < buffer.size())
        {
            buffer.resize(size);
            return fs::path(buffer);
        }
        buffer.resize(buffer.size() * 2, L'\0');
    }
#else
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (ec)
    {
        PLOG_ERROR << "Failed to read /proc/self/exe: " << ec.message();
        return {};
    }
    return self;
#endif
}

std::wstring ProcessUtils::QuoteArgument(const std::wstring& arg)
{
    if (!arg.empty() && arg.find_first_of(L" \t\"") == std::wstring::npos)
        return arg;

    std::wstring quoted = L"\"";
    size_t backslashes = 0;
    for (wchar_t c : arg)
    {
        if (c == L'\\')
        {
            ++backslashes;
            continue;
        }
        if (c == L'"')
        {
            quoted.append(backslashes * 2 + 1, L'\\');
        }
        else
        {
            quoted.append(backslashes, L'\\');
        }
        backslashes = 0;
        quoted.push_back(c);
    }
    quoted.append(backslashes * 2, L'\\');
    quoted.push_back(L'"');
    return quoted;
}

bool ProcessUtils::LaunchDetached(const fs::path& exePath, const std::vector<std::string>& args,
                                  const fs::path& workingDir)
{
    std::error_code ec;
    if (exePath.empty() || !fs::is_regular_file(exePath, ec))
    {
        PLOG_ERROR << "Cannot launch missing executable: " << exePath.string();
        return false;
    }

#ifdef _WIN32
    std::wstring cmdLine = QuoteArgument(exePath.wstring());
    for (const auto& arg : args)
    {
        cmdLine += L" " + QuoteArgument(fs::path(arg).wstring());
    }

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi{};
    const std::wstring cwd = workingDir.wstring();
    if (!CreateProcessW(nullptr, cmdLine.data(), nullptr, nullptr, FALSE, DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP,
                        nullptr, cwd.empty() ? nullptr : cwd.c_str(), &si, &pi))
    {
        PLOG_ERROR << "CreateProcessW failed for " << exePath.string() << ": " << GetLastError();
        return false;
    }
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
#else
    const pid_t pid = fork();
    if (pid < 0)
    {
        PLOG_ERROR << "fork() failed: " << std::strerror(errno);
        return false;
    }

    if (pid == 0)
    {
        // Child: only async-signal-safe calls until exec
        if (setsid() < 0)
            _exit(1);
        if (!workingDir.empty() && chdir(workingDir.c_str()) != 0)
            _exit(1);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(exePath.c_str()));
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execv(exePath.c_str(), argv.data());
        _exit(127);
    }
#endif

    PLOG_INFO << "Launched " << exePath.string();
    return true;
}

} // namespace utils
