#include <catch2/catch_test_macros.hpp>

#include "updater/GitHubReleaseChecker.hpp"
#include "updater/UpdateErrors.hpp"
#include "../utils/fakes.hpp"
#include "../utils/mock_http.hpp"

using namespace updater;
using test_utils::MockResponses;

TEST_CASE("GitHub release parsing", "[updater][release]") {

    SECTION("Full release document") {
        const auto response = MockResponses::github_release(
            "v1.4.0",
            { { "cabplanner-1.4.0-windows.zip", 52428800, "sha256:ABCDEF0123" },
              { "Source-Code.zip", 1024, "" } },
            true);

        const ReleaseDescriptor release = GitHubReleaseChecker::parseRelease(response.body);
        REQUIRE(release.tagName == "v1.4.0");
        REQUIRE(release.name == "Cabplanner v1.4.0");
        REQUIRE(release.prerelease);
        REQUIRE(release.htmlUrl == "https://github.com/bmruszaj/cabplanner/releases/tag/v1.4.0");
        REQUIRE(release.publishedAt == "2026-03-01T10:00:00Z");
        REQUIRE(release.assets.size() == 2);

        // Listing order is preserved
        REQUIRE(release.assets[0].name == "cabplanner-1.4.0-windows.zip");
        REQUIRE(release.assets[0].size == 52428800);
        REQUIRE(release.assets[0].downloadUrl ==
                "https://github.com/bmruszaj/cabplanner/releases/download/v1.4.0/cabplanner-1.4.0-windows.zip");
        REQUIRE(release.assets[0].sha256 == "ABCDEF0123");
        REQUIRE(release.assets[1].name == "Source-Code.zip");
        REQUIRE(release.assets[1].sha256.empty());
    }

    SECTION("Null release name falls back to the tag") {
        const auto release = GitHubReleaseChecker::parseRelease(MockResponses::github_release_null_name("v2.0.0").body);
        REQUIRE(release.name == "v2.0.0");
        REQUIRE(release.assets.empty());
        REQUIRE_FALSE(release.prerelease);
    }

    SECTION("Missing required fields are malformed") {
        REQUIRE_THROWS_AS(GitHubReleaseChecker::parseRelease(MockResponses::github_missing_tag().body),
                          MalformedResponseError);
        REQUIRE_THROWS_AS(GitHubReleaseChecker::parseRelease(MockResponses::github_asset_without_size().body),
                          MalformedResponseError);
        REQUIRE_THROWS_AS(GitHubReleaseChecker::parseRelease(R"({"tag_name": "v1.0.0", "assets": []})"),
                          MalformedResponseError);
    }

    SECTION("Invalid JSON is malformed") {
        REQUIRE_THROWS_AS(GitHubReleaseChecker::parseRelease(MockResponses::github_invalid_json().body),
                          MalformedResponseError);
        REQUIRE_THROWS_AS(GitHubReleaseChecker::parseRelease("[]"), MalformedResponseError);
        REQUIRE_THROWS_AS(GitHubReleaseChecker::parseRelease(R"({"tag_name": 5, "name": "x"})"),
                          MalformedResponseError);
    }
}

TEST_CASE("GitHub release checker - request setup", "[updater][release]") {

    SECTION("Explicit token is sent as bearer credential") {
        GitHubReleaseChecker checker("secret-token", "https://ghe.example.com/api/v3/");
        REQUIRE(checker.isAuthenticated());
        REQUIRE(checker.latestReleaseUrl("bmruszaj/cabplanner") ==
                "https://ghe.example.com/api/v3/repos/bmruszaj/cabplanner/releases/latest");

        const auto headers = checker.requestHeaders();
        REQUIRE(headers.at("Authorization") == "Bearer secret-token");
        REQUIRE(headers.at("Accept") == "application/vnd.github+json");
        REQUIRE(headers.count("User-Agent") == 1);
    }

    SECTION("Explicit token wins over the environment") {
        REQUIRE(GitHubReleaseChecker::resolveToken("explicit") == "explicit");
    }
}

TEST_CASE("Release source test double", "[updater][release]") {
    test_utils::MockReleaseSource source;

    SECTION("Serves canned releases by repository") {
        source.http.setResponse("https://api.github.com/repos/bmruszaj/cabplanner/releases/latest",
                                MockResponses::github_release("v1.1.0", { { "cabplanner-1.1.0-windows.zip", 10, "" } }));

        const auto release = source.fetchLatest("bmruszaj/cabplanner");
        REQUIRE(release.tagName == "v1.1.0");
        REQUIRE(source.http.requests().size() == 1);
    }

    SECTION("Transport failures and HTTP errors are network errors") {
        source.http.simulateNetworkError("connection refused");
        REQUIRE_THROWS_AS(source.fetchLatest("bmruszaj/cabplanner"), NetworkError);

        source.http.clearResponses();
        REQUIRE_THROWS_AS(source.fetchLatest("someone/unknown"), NetworkError);

        source.http.setResponse("https://api.github.com/repos/bmruszaj/cabplanner/releases/latest",
                                MockResponses::timeout_error());
        REQUIRE_THROWS_AS(source.fetchLatest("bmruszaj/cabplanner"), NetworkError);
        source.http.clearResponses();

        source.http.setPatternResponse("/releases/latest$", MockResponses::github_rate_limited());
        try {
            source.fetchLatest("bmruszaj/cabplanner");
            FAIL("expected NetworkError");
        } catch (const NetworkError& e) {
            REQUIRE(e.kind() == UpdateErrorKind::Network);
        }
    }
}
