#pragma once

#include "ReleaseSource.hpp"
#include "UpdateTypes.hpp"

#include <chrono>
#include <map>
#include <string>

namespace updater
{

inline constexpr const char* kTokenEnvironmentVariable = "GITHUB_TOKEN";

// GitHub Releases API client
class GitHubReleaseChecker : public IReleaseSource
{
public:
    // Empty token: fall back to $GITHUB_TOKEN, and to anonymous requests without it
    explicit GitHubReleaseChecker(std::string token = {}, std::string apiBaseUrl = "https://api.github.com",
                                  std::chrono::seconds timeout = std::chrono::seconds{ 10 });
    ~GitHubReleaseChecker() override = default;

    ReleaseDescriptor fetchLatest(const std::string& repoId) override;

    bool isAuthenticated() const { return !token_.empty(); }

    std::string latestReleaseUrl(const std::string& repoId) const;

    // Request headers; Authorization is present only when a token is known
    std::map<std::string, std::string> requestHeaders() const;

    // Builds a descriptor from a /releases/latest response body
    static ReleaseDescriptor parseRelease(const std::string& body);

    static std::string resolveToken(const std::string& explicitToken);

private:
    std::string token_;
    std::string apiBaseUrl_;
    std::chrono::seconds timeout_;
};

} // namespace updater
