#include "PackageDownloader.hpp"
#include "UpdateErrors.hpp"

#include <cpr/cpr.h>
#include <plog/Log.h>

#include <picosha2.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace updater
{

namespace
{

void removePartial(const fs::path& destPath)
{
    std::error_code ec;
    fs::remove(destPath, ec);
    if (ec)
    {
        PLOG_WARNING << "Failed to remove partial download " << destPath.string() << ": " << ec.message();
    }
}

} // namespace

PackageDownloader::PackageDownloader(std::chrono::seconds timeout)
    : timeout_(timeout)
{
}

std::string PackageDownloader::formatSpeed(double bytesPerSecond)
{
    if (bytesPerSecond < 1024)
        return std::to_string(static_cast<int>(bytesPerSecond)) + " B/s";
    if (bytesPerSecond < 1024 * 1024)
        return std::to_string(static_cast<int>(bytesPerSecond / 1024)) + " KB/s";
    return std::to_string(static_cast<int>(bytesPerSecond / (1024 * 1024))) + " MB/s";
}

void PackageDownloader::download(const AssetDescriptor& asset, const fs::path& destPath,
                                 const PackageProgressCallback& progressCallback, const std::atomic<bool>& cancelled)
{
    PLOG_INFO << "Starting download: " << asset.downloadUrl;

    cpr::Response response;
    {
        std::ofstream outputFile(destPath, std::ios::binary | std::ios::trunc);
        if (!outputFile.is_open())
        {
            PLOG_ERROR << "Failed to create output file: " << destPath.string();
            throw DownloadIncompleteError("Failed to create output file", destPath.string());
        }

        auto startTime = std::chrono::steady_clock::now();
        cpr::cpr_off_t lastBytes = 0;
        auto lastProgressTime = startTime;

        response = cpr::Download(
            outputFile, cpr::Url{ asset.downloadUrl },
            cpr::Header{ { "User-Agent", "Cabplanner-Updater/1.0" } },
            cpr::ProgressCallback{
                [&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow, cpr::cpr_off_t, cpr::cpr_off_t,
                    intptr_t) -> bool
                {
                    if (cancelled)
                    {
                        return false;
                    }

                    if (downloadTotal > 0 && progressCallback)
                    {
                        auto now = std::chrono::steady_clock::now();
                        auto elapsed =
                            std::chrono::duration_cast<std::chrono::milliseconds>(now - lastProgressTime).count();

                        if (elapsed >= 100)
                        {
                            DownloadProgress progress;
                            progress.bytesDownloaded = static_cast<size_t>(downloadNow);
                            progress.totalBytes = static_cast<size_t>(downloadTotal);
                            progress.percentage = (static_cast<float>(downloadNow) / downloadTotal) * 100.0f;
                            progress.speed = formatSpeed((downloadNow - lastBytes) * 1000.0 / elapsed);

                            progressCallback(progress);

                            lastBytes = downloadNow;
                            lastProgressTime = now;
                        }
                    }

                    return true;
                } },
            cpr::Timeout{ std::chrono::duration_cast<std::chrono::milliseconds>(timeout_) });
    }

    if (cancelled)
    {
        PLOG_INFO << "Download cancelled";
        removePartial(destPath);
        throw UpdateCancelledError("Download cancelled");
    }

    if (response.error.code != cpr::ErrorCode::OK)
    {
        PLOG_ERROR << "Download failed for " << asset.downloadUrl << ": " << response.error.message;
        removePartial(destPath);
        throw NetworkError("Download failed", response.error.message);
    }

    if (response.status_code != 200)
    {
        PLOG_ERROR << "Download failed with status: " << response.status_code;
        removePartial(destPath);
        throw NetworkError("HTTP error " + std::to_string(response.status_code), asset.downloadUrl);
    }

    try
    {
        const std::string contentLength = response.header["content-length"];
        if (!contentLength.empty())
        {
            const auto expected = std::stoull(contentLength);
            std::error_code ec;
            const auto actual = fs::file_size(destPath, ec);
            if (ec || actual != expected)
            {
                PLOG_ERROR << "Download size mismatch: expected " << expected << ", got " << (ec ? 0 : actual);
                throw DownloadIncompleteError("Download incomplete: expected " + std::to_string(expected) +
                                              " bytes, got " + std::to_string(ec ? 0 : actual));
            }
        }
        else
        {
            PLOG_WARNING << "No Content-Length header in response";
        }

        verifyDownloadedFile(destPath, asset);
    }
    catch (const UpdateException&)
    {
        removePartial(destPath);
        throw;
    }
    catch (const std::logic_error& e)
    {
        // std::stoull on a garbled header
        removePartial(destPath);
        throw DownloadIncompleteError("Invalid Content-Length header", e.what());
    }

    PLOG_INFO << "Download completed: " << destPath.string();
}

void PackageDownloader::verifyDownloadedFile(const fs::path& filePath, const AssetDescriptor& asset)
{
    std::error_code ec;
    const auto actual = fs::file_size(filePath, ec);
    if (ec || actual == 0)
    {
        PLOG_ERROR << "Downloaded file is empty: " << filePath.string();
        throw DownloadIncompleteError("Downloaded package is empty", filePath.string());
    }

    if (asset.size > 0 && actual != asset.size)
    {
        PLOG_ERROR << "Downloaded " << actual << " bytes, release lists " << asset.size << " for " << asset.name;
        throw DownloadIncompleteError("Download incomplete: expected " + std::to_string(asset.size) + " bytes, got " +
                                      std::to_string(actual));
    }

    if (!asset.sha256.empty())
    {
        std::string error;
        if (!verifyChecksum(filePath.string(), asset.sha256, error))
        {
            PLOG_ERROR << error;
            throw ChecksumMismatchError("Package checksum does not match the release digest", error);
        }
        PLOG_DEBUG << "Checksum verified for " << asset.name;
    }
}

bool PackageDownloader::verifyChecksum(const std::string& filePath, const std::string& expectedSha256,
                                       std::string& outError)
{
    try
    {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open())
        {
            outError = "Failed to open file for checksum verification";
            return false;
        }

        std::vector<unsigned char> hash(picosha2::k_digest_size);
        picosha2::hash256(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>(), hash.begin(),
                          hash.end());

        std::string actualSha256 = picosha2::bytes_to_hex_string(hash.begin(), hash.end());

        std::string expected = expectedSha256;
        std::transform(expected.begin(), expected.end(), expected.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        if (actualSha256 != expected)
        {
            outError = "Checksum mismatch: expected " + expected + ", got " + actualSha256;
            return false;
        }

        return true;
    }
    catch (const std::exception& e)
    {
        outError = std::string("Checksum verification error: ") + e.what();
        return false;
    }
}

} // namespace updater
