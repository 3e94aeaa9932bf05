#include <catch2/catch_test_macros.hpp>

#include "updater/UpdateSchedule.hpp"

#include <chrono>
#include <string>

using namespace updater;

namespace {

using Clock = std::chrono::system_clock;

Clock::time_point daysAgo(Clock::time_point now, int days) {
    return now - std::chrono::hours{ 24 * days };
}

}  // namespace

TEST_CASE("UpdateSchedule - frequency labels", "[updater][schedule]") {
    REQUIRE(parseCheckFrequency("on_launch") == CheckFrequency::OnLaunch);
    REQUIRE(parseCheckFrequency("Daily") == CheckFrequency::Daily);
    REQUIRE(parseCheckFrequency("WEEKLY") == CheckFrequency::Weekly);
    REQUIRE(parseCheckFrequency("monthly") == CheckFrequency::Monthly);
    REQUIRE(parseCheckFrequency("never") == CheckFrequency::Never);
    REQUIRE(parseCheckFrequency("fortnightly") == CheckFrequency::Weekly);

    REQUIRE(std::string(toString(CheckFrequency::OnLaunch)) == "on_launch");
    REQUIRE(std::string(toString(CheckFrequency::Monthly)) == "monthly");
}

TEST_CASE("UpdateSchedule - shouldCheck", "[updater][schedule]") {
    const auto now = Clock::now();
    const Clock::time_point never{};

    SECTION("Disabled or never") {
        REQUIRE_FALSE(UpdateSchedule::shouldCheck(false, CheckFrequency::OnLaunch, never, now));
        REQUIRE_FALSE(UpdateSchedule::shouldCheck(true, CheckFrequency::Never, never, now));
    }

    SECTION("First check is always due") {
        REQUIRE(UpdateSchedule::shouldCheck(true, CheckFrequency::Monthly, never, now));
    }

    SECTION("On launch ignores the last check") {
        REQUIRE(UpdateSchedule::shouldCheck(true, CheckFrequency::OnLaunch, now, now));
    }

    SECTION("Interval boundaries") {
        REQUIRE_FALSE(UpdateSchedule::shouldCheck(true, CheckFrequency::Daily, now - std::chrono::hours{ 23 }, now));
        REQUIRE(UpdateSchedule::shouldCheck(true, CheckFrequency::Daily, daysAgo(now, 1), now));
        REQUIRE_FALSE(UpdateSchedule::shouldCheck(true, CheckFrequency::Weekly, daysAgo(now, 6), now));
        REQUIRE(UpdateSchedule::shouldCheck(true, CheckFrequency::Weekly, daysAgo(now, 7), now));
        REQUIRE_FALSE(UpdateSchedule::shouldCheck(true, CheckFrequency::Monthly, daysAgo(now, 29), now));
        REQUIRE(UpdateSchedule::shouldCheck(true, CheckFrequency::Monthly, daysAgo(now, 30), now));
    }
}
