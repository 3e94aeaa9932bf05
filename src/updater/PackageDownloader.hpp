#pragma once

#include "UpdateTypes.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace updater
{

using PackageProgressCallback = std::function<void(const DownloadProgress&)>;

class IPackageDownloader
{
public:
    virtual ~IPackageDownloader() = default;

    // Streams asset into destPath. Throws NetworkError on transport failure,
    // DownloadIncompleteError on an empty or truncated result and
    // UpdateCancelledError when cancelled is raised mid-transfer.
    virtual void download(const AssetDescriptor& asset, const std::filesystem::path& destPath,
                          const PackageProgressCallback& progressCallback, const std::atomic<bool>& cancelled) = 0;
};

class PackageDownloader : public IPackageDownloader
{
public:
    explicit PackageDownloader(std::chrono::seconds timeout = std::chrono::seconds{ 300 });
    ~PackageDownloader() override = default;

    void download(const AssetDescriptor& asset, const std::filesystem::path& destPath,
                  const PackageProgressCallback& progressCallback, const std::atomic<bool>& cancelled) override;

    // Throws DownloadIncompleteError unless the file is non-empty and matches the
    // advertised size, and ChecksumMismatchError when a digest is known and differs
    static void verifyDownloadedFile(const std::filesystem::path& filePath, const AssetDescriptor& asset);

    static bool verifyChecksum(const std::string& filePath, const std::string& expectedSha256, std::string& outError);

    static std::string formatSpeed(double bytesPerSecond);

private:
    std::chrono::seconds timeout_;
};

} // namespace updater
