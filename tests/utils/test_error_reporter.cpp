#include <catch2/catch_test_macros.hpp>

#include "utils/ErrorReporter.hpp"

#include <string>

using namespace utils;

TEST_CASE("ErrorReporter - queue", "[utils][errors]") {
    ErrorReporter::ClearErrors();

    SECTION("Reports are drained once") {
        ErrorReporter::ReportWarning(ErrorCategory::Platform, "Start the application manually.", "cabplanner.exe");
        ErrorReporter::ReportFatal(ErrorCategory::Installation, "Reinstall the application manually.");
        REQUIRE(ErrorReporter::HasPendingErrors());

        const auto reports = ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == 2);
        REQUIRE(reports[0].severity == ErrorSeverity::Warning);
        REQUIRE(reports[1].severity == ErrorSeverity::Fatal);
        REQUIRE(reports[1].category == ErrorCategory::Installation);
        REQUIRE_FALSE(reports[0].timestamp.empty());

        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
        REQUIRE(ErrorReporter::GetPendingErrors().empty());
    }

    SECTION("Only the newest hundred reports are kept") {
        for (int i = 0; i < 105; ++i) {
            ErrorReporter::ReportError(ErrorCategory::Network, "attempt " + std::to_string(i));
        }
        const auto reports = ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == 100);
        REQUIRE(reports.front().user_message == "attempt 5");
        REQUIRE(reports.back().user_message == "attempt 104");
    }
}

TEST_CASE("ErrorReporter - formatting", "[utils][errors]") {
    const ErrorReport withDetails(ErrorCategory::Package, ErrorSeverity::Error, "Package checksum does not match",
                                  "expected abc, got def");
    REQUIRE(ErrorReporter::FormatReport(withDetails) ==
            "[Error] Package: Package checksum does not match (expected abc, got def)");

    const ErrorReport plain(ErrorCategory::Configuration, ErrorSeverity::Warning, "Using defaults", "");
    REQUIRE(ErrorReporter::FormatReport(plain) == "[Warning] Configuration: Using defaults");

    REQUIRE(ErrorReporter::GetTimestamp().size() == 19);
}
