#pragma once

#include <chrono>
#include <string>

namespace updater
{

enum class CheckFrequency
{
    OnLaunch,
    Daily,
    Weekly,
    Monthly,
    Never
};

// Unknown labels fall back to Weekly
CheckFrequency parseCheckFrequency(const std::string& label);
const char* toString(CheckFrequency frequency);

class UpdateSchedule
{
public:
    using TimePoint = std::chrono::system_clock::time_point;

    // lastCheck at the epoch means no check has been recorded yet
    static bool shouldCheck(bool enabled, CheckFrequency frequency, TimePoint lastCheck, TimePoint now);

    // Whole days that must elapse between checks (0 for OnLaunch, -1 for Never)
    static int intervalDays(CheckFrequency frequency);
};

} // namespace updater
