#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace updater
{

enum class UpdateErrorKind
{
    Unknown = 1,
    Network,
    MalformedResponse,
    InvalidVersion,
    NoSuitableAsset,
    DownloadIncomplete,
    ChecksumMismatch,
    UnsafeArchive,
    CorruptArchive,
    Layout,
    Swap,
    RollbackFailed,
    Cancelled,
    UpdateInProgress,
    NotPackaged
};

const char* toString(UpdateErrorKind kind);

// Base of every failure raised by the update pipeline
class UpdateException : public std::runtime_error
{
public:
    UpdateException(UpdateErrorKind kind, const std::string& message, std::string details = {})
        : std::runtime_error(message)
        , kind_(kind)
        , details_(std::move(details))
    {
    }

    UpdateErrorKind kind() const { return kind_; }

    const std::string& details() const { return details_; }

private:
    UpdateErrorKind kind_;
    std::string details_;
};

#define CABPLANNER_DEFINE_UPDATE_ERROR(Name, Kind)                                                                   \
    class Name : public UpdateException                                                                              \
    {                                                                                                                \
    public:                                                                                                          \
        explicit Name(const std::string& message, std::string details = {})                                         \
            : UpdateException(UpdateErrorKind::Kind, message, std::move(details))                                   \
        {                                                                                                            \
        }                                                                                                            \
    };

// Registry unreachable, timed out or answered with an HTTP error
CABPLANNER_DEFINE_UPDATE_ERROR(NetworkError, Network)
// Registry answered but required fields are missing
CABPLANNER_DEFINE_UPDATE_ERROR(MalformedResponseError, MalformedResponse)
CABPLANNER_DEFINE_UPDATE_ERROR(InvalidVersionError, InvalidVersion)
CABPLANNER_DEFINE_UPDATE_ERROR(NoSuitableAssetError, NoSuitableAsset)
CABPLANNER_DEFINE_UPDATE_ERROR(DownloadIncompleteError, DownloadIncomplete)
CABPLANNER_DEFINE_UPDATE_ERROR(ChecksumMismatchError, ChecksumMismatch)
// Archive entry would land outside the extraction directory (zip-slip)
CABPLANNER_DEFINE_UPDATE_ERROR(UnsafeArchiveError, UnsafeArchive)
CABPLANNER_DEFINE_UPDATE_ERROR(CorruptArchiveError, CorruptArchive)
CABPLANNER_DEFINE_UPDATE_ERROR(LayoutError, Layout)
CABPLANNER_DEFINE_UPDATE_ERROR(SwapError, Swap)
CABPLANNER_DEFINE_UPDATE_ERROR(RollbackFailedError, RollbackFailed)
CABPLANNER_DEFINE_UPDATE_ERROR(UpdateCancelledError, Cancelled)
CABPLANNER_DEFINE_UPDATE_ERROR(UpdateInProgressError, UpdateInProgress)
CABPLANNER_DEFINE_UPDATE_ERROR(NotPackagedError, NotPackaged)

#undef CABPLANNER_DEFINE_UPDATE_ERROR

} // namespace updater
