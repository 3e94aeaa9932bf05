#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace updater
{

// Update state machine
enum class UpdateState
{
    Idle, // No update activity (also the no-op terminal state)
    Checking, // Querying the release registry
    Downloading, // Streaming the chosen asset
    Verifying, // Extracting and probing the package
    Staging, // Package verified, live install untouched
    Swapping, // Replacing the live install
    Succeeded, // New version installed
    RolledBack, // Swap failed, original install restored
    Failed // Attempt failed
};

const char* toString(UpdateState state);

// One downloadable file attached to a release
struct AssetDescriptor
{
    std::string name; // e.g., "cabplanner-1.4.0-windows.zip"
    std::string downloadUrl; // browser_download_url
    std::uint64_t size; // Size in bytes as advertised by the registry
    std::string sha256; // Lowercase hex digest, empty when the registry has none

    AssetDescriptor()
        : size(0)
    {
    }

    AssetDescriptor(std::string n, std::string url, std::uint64_t s)
        : name(std::move(n))
        , downloadUrl(std::move(url))
        , size(s)
    {
    }
};

// One published release as reported by the registry
struct ReleaseDescriptor
{
    std::string tagName; // e.g., "v1.4.0"
    std::string name; // Human readable title
    bool prerelease; // Marked as pre-release on the registry
    std::string htmlUrl; // Release page
    std::string publishedAt; // ISO 8601 format
    std::vector<AssetDescriptor> assets;

    ReleaseDescriptor()
        : prerelease(false)
    {
    }
};

// Download progress information
struct DownloadProgress
{
    size_t bytesDownloaded; // Bytes downloaded so far
    size_t totalBytes; // Total package size
    float percentage; // Download percentage (0-100)
    std::string speed; // Human-readable speed (e.g., "2.5 MB/s")

    DownloadProgress()
        : bytesDownloaded(0)
        , totalBytes(0)
        , percentage(0.0f)
    {
    }
};

// Error information for failed updates
struct UpdateError
{
    std::string message; // Human-readable error message
    std::string technicalInfo; // Technical details for logging
    int errorCode; // UpdateErrorKind value, 0 when unset

    UpdateError()
        : errorCode(0)
    {
    }

    UpdateError(const std::string& msg)
        : message(msg)
        , errorCode(0)
    {
    }

    UpdateError(const std::string& msg, const std::string& tech, int code)
        : message(msg)
        , technicalInfo(tech)
        , errorCode(code)
    {
    }
};

// On-disk contract of an installed copy: <root>/<executable>, <root>/<supportDir>/
// and <root>/<stateFile>, the last of which an update never touches.
struct InstallationLayout
{
    std::filesystem::path root;
    std::string executableName;
    std::string supportDirName;
    std::string stateFileName;

    std::filesystem::path executable() const { return root / executableName; }

    std::filesystem::path supportDir() const { return root / supportDirName; }

    std::filesystem::path stateFile() const { return root / stateFileName; }
};

} // namespace updater
