#include <catch2/catch_test_macros.hpp>

#include "platform/ProcessDetector.hpp"
#include "platform/ProcessUtils.hpp"

#include <filesystem>

using utils::ProcessUtils;

TEST_CASE("ProcessUtils - argument quoting", "[platform]") {
    REQUIRE(ProcessUtils::QuoteArgument(L"plain") == L"plain");
    REQUIRE(ProcessUtils::QuoteArgument(L"") == L"\"\"");
    REQUIRE(ProcessUtils::QuoteArgument(L"C:\\Program Files\\Cabplanner\\cabplanner.exe") ==
            L"\"C:\\Program Files\\Cabplanner\\cabplanner.exe\"");
    REQUIRE(ProcessUtils::QuoteArgument(L"say \"hi\"") == L"\"say \\\"hi\\\"\"");
    REQUIRE(ProcessUtils::QuoteArgument(L"dir with space\\") == L"\"dir with space\\\\\"");
}

TEST_CASE("ProcessUtils - executable path", "[platform]") {
    const auto self = ProcessUtils::GetExecutablePath();
    REQUIRE_FALSE(self.empty());
    REQUIRE(std::filesystem::exists(self));
}

TEST_CASE("ProcessUtils - launching a missing executable fails", "[platform]") {
    REQUIRE_FALSE(ProcessUtils::LaunchDetached("/nonexistent/cabplanner.exe", {}));
}

TEST_CASE("ProcessDetector - scanning", "[platform]") {
    SECTION("Unknown executable is not running") {
        REQUIRE(ProcessDetector::findInstances("cabplanner-no-such-process.exe").empty());
    }

    SECTION("Empty name never matches") {
        REQUIRE(ProcessDetector::findInstances("").empty());
    }
}
