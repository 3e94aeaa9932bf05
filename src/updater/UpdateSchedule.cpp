#include "UpdateSchedule.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>

namespace updater
{

CheckFrequency parseCheckFrequency(const std::string& label)
{
    std::string lower = label;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "on_launch")
        return CheckFrequency::OnLaunch;
    if (lower == "daily")
        return CheckFrequency::Daily;
    if (lower == "weekly")
        return CheckFrequency::Weekly;
    if (lower == "monthly")
        return CheckFrequency::Monthly;
    if (lower == "never")
        return CheckFrequency::Never;

    PLOG_WARNING << "Unknown update check frequency '" << label << "', using weekly";
    return CheckFrequency::Weekly;
}

const char* toString(CheckFrequency frequency)
{
    switch (frequency)
    {
    case CheckFrequency::OnLaunch:
        return "on_launch";
    case CheckFrequency::Daily:
        return "daily";
    case CheckFrequency::Weekly:
        return "weekly";
    case CheckFrequency::Monthly:
        return "monthly";
    case CheckFrequency::Never:
        return "never";
    }
    return "weekly";
}

int UpdateSchedule::intervalDays(CheckFrequency frequency)
{
    switch (frequency)
    {
    case CheckFrequency::OnLaunch:
        return 0;
    case CheckFrequency::Daily:
        return 1;
    case CheckFrequency::Weekly:
        return 7;
    case CheckFrequency::Monthly:
        return 30;
    case CheckFrequency::Never:
        return -1;
    }
    return 7;
}

bool UpdateSchedule::shouldCheck(bool enabled, CheckFrequency frequency, TimePoint lastCheck, TimePoint now)
{
    if (!enabled || frequency == CheckFrequency::Never)
        return false;

    if (lastCheck == TimePoint{})
        return true;

    if (frequency == CheckFrequency::OnLaunch)
        return true;

    const auto elapsed = std::chrono::duration_cast<std::chrono::hours>(now - lastCheck).count() / 24;
    return elapsed >= intervalDays(frequency);
}

} // namespace updater
