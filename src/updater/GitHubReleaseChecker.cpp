#include "GitHubReleaseChecker.hpp"
#include "UpdateErrors.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <cstdlib>

using json = nlohmann::json;

namespace updater
{

namespace
{

std::string requireString(const json& object, const char* key, const char* context)
{
    if (!object.contains(key) || !object[key].is_string())
    {
        throw MalformedResponseError(std::string(context) + " missing '" + key + "' field");
    }
    return object[key].get<std::string>();
}

AssetDescriptor parseAsset(const json& assetJson)
{
    if (!assetJson.is_object())
    {
        throw MalformedResponseError("Release asset is not an object");
    }

    AssetDescriptor asset;
    asset.name = requireString(assetJson, "name", "Release asset");
    asset.downloadUrl = requireString(assetJson, "browser_download_url", "Release asset");

    if (!assetJson.contains("size") || !assetJson["size"].is_number_integer())
    {
        throw MalformedResponseError("Release asset '" + asset.name + "' missing 'size' field");
    }
    asset.size = assetJson["size"].get<std::uint64_t>();

    // Newer API versions publish "digest": "sha256:<hex>"
    if (assetJson.contains("digest") && assetJson["digest"].is_string())
    {
        const std::string digest = assetJson["digest"].get<std::string>();
        constexpr const char* kSha256Prefix = "sha256:";
        if (digest.rfind(kSha256Prefix, 0) == 0)
        {
            asset.sha256 = digest.substr(std::char_traits<char>::length(kSha256Prefix));
        }
    }
    return asset;
}

} // namespace

GitHubReleaseChecker::GitHubReleaseChecker(std::string token, std::string apiBaseUrl, std::chrono::seconds timeout)
    : token_(resolveToken(token))
    , apiBaseUrl_(std::move(apiBaseUrl))
    , timeout_(timeout)
{
    while (!apiBaseUrl_.empty() && apiBaseUrl_.back() == '/')
    {
        apiBaseUrl_.pop_back();
    }
}

std::string GitHubReleaseChecker::resolveToken(const std::string& explicitToken)
{
    if (!explicitToken.empty())
        return explicitToken;

    const char* fromEnv = std::getenv(kTokenEnvironmentVariable);
    return fromEnv ? std::string(fromEnv) : std::string();
}

std::string GitHubReleaseChecker::latestReleaseUrl(const std::string& repoId) const
{
    return apiBaseUrl_ + "/repos/" + repoId + "/releases/latest";
}

std::map<std::string, std::string> GitHubReleaseChecker::requestHeaders() const
{
    std::map<std::string, std::string> headers{
        { "Accept", "application/vnd.github+json" },
        { "User-Agent", "Cabplanner-Updater/1.0" },
        { "X-GitHub-Api-Version", "2022-11-28" },
    };
    if (!token_.empty())
    {
        headers["Authorization"] = "Bearer " + token_;
    }
    return headers;
}

ReleaseDescriptor GitHubReleaseChecker::fetchLatest(const std::string& repoId)
{
    const std::string url = latestReleaseUrl(repoId);
    PLOG_INFO << "Checking GitHub for updates: " << repoId << (token_.empty() ? " (anonymous)" : " (authenticated)");
    PLOG_DEBUG << "Fetching latest release from: " << url;

    cpr::Header header;
    for (const auto& [key, value] : requestHeaders())
    {
        header[key] = value;
    }

    auto response = cpr::Get(cpr::Url{ url }, header,
                             cpr::Timeout{ std::chrono::duration_cast<std::chrono::milliseconds>(timeout_) });

    if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT)
    {
        PLOG_ERROR << "Timeout while fetching release info from " << url;
        throw NetworkError("Timed out contacting the release registry", response.error.message);
    }
    if (response.error.code != cpr::ErrorCode::OK)
    {
        PLOG_ERROR << "Network error while fetching release info: " << response.error.message;
        throw NetworkError("Could not reach the release registry", response.error.message);
    }

    // Check HTTP status
    if (response.status_code != 200)
    {
        std::string error = "Release registry returned status " + std::to_string(response.status_code);
        if ((response.status_code == 403 || response.status_code == 429) &&
            response.header["x-ratelimit-remaining"] == "0")
        {
            error += " (rate limit exceeded";
            error += token_.empty() ? std::string(", set ") + kTokenEnvironmentVariable + ")" : ")";
        }
        else if (response.status_code == 404)
        {
            error += " (no published release for " + repoId + ")";
        }
        PLOG_ERROR << error;
        throw NetworkError(error, url);
    }

    ReleaseDescriptor release = parseRelease(response.text);
    PLOG_INFO << "Latest release: " << release.tagName << " (" << release.assets.size() << " assets"
              << (release.prerelease ? ", pre-release)" : ")");
    return release;
}

ReleaseDescriptor GitHubReleaseChecker::parseRelease(const std::string& body)
{
    json releaseJson;
    try
    {
        releaseJson = json::parse(body);
    }
    catch (const json::exception& e)
    {
        PLOG_ERROR << "JSON parse error: " << e.what();
        throw MalformedResponseError("Release response is not valid JSON", e.what());
    }

    if (!releaseJson.is_object())
    {
        throw MalformedResponseError("Release response is not a JSON object");
    }

    try
    {
        ReleaseDescriptor release;
        release.tagName = requireString(releaseJson, "tag_name", "Release");
        if (release.tagName.empty())
        {
            throw MalformedResponseError("Release has an empty 'tag_name'");
        }

        // "name" is required but GitHub sends null for untitled releases
        if (!releaseJson.contains("name"))
        {
            throw MalformedResponseError("Release missing 'name' field");
        }
        release.name = releaseJson["name"].is_string() ? releaseJson["name"].get<std::string>() : release.tagName;

        release.prerelease = releaseJson.value("prerelease", false);
        release.htmlUrl = releaseJson.value("html_url", "");
        release.publishedAt = releaseJson.value("published_at", "");

        if (releaseJson.contains("assets"))
        {
            if (!releaseJson["assets"].is_array())
            {
                throw MalformedResponseError("Release 'assets' is not an array");
            }
            for (const auto& assetJson : releaseJson["assets"])
            {
                release.assets.push_back(parseAsset(assetJson));
            }
        }
        return release;
    }
    catch (const json::exception& e)
    {
        PLOG_ERROR << "Invalid response format: " << e.what();
        throw MalformedResponseError("Release response has unexpected field types", e.what());
    }
}

} // namespace updater
