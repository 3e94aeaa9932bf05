#include "UpdateTypes.hpp"
#include "UpdateErrors.hpp"

namespace updater
{

const char* toString(UpdateState state)
{
    switch (state)
    {
    case UpdateState::Idle:
        return "Idle";
    case UpdateState::Checking:
        return "Checking";
    case UpdateState::Downloading:
        return "Downloading";
    case UpdateState::Verifying:
        return "Verifying";
    case UpdateState::Staging:
        return "Staging";
    case UpdateState::Swapping:
        return "Swapping";
    case UpdateState::Succeeded:
        return "Succeeded";
    case UpdateState::RolledBack:
        return "RolledBack";
    case UpdateState::Failed:
        return "Failed";
    }
    return "Unknown";
}

const char* toString(UpdateErrorKind kind)
{
    switch (kind)
    {
    case UpdateErrorKind::Unknown:
        return "Unknown";
    case UpdateErrorKind::Network:
        return "Network";
    case UpdateErrorKind::MalformedResponse:
        return "MalformedResponse";
    case UpdateErrorKind::InvalidVersion:
        return "InvalidVersion";
    case UpdateErrorKind::NoSuitableAsset:
        return "NoSuitableAsset";
    case UpdateErrorKind::DownloadIncomplete:
        return "DownloadIncomplete";
    case UpdateErrorKind::ChecksumMismatch:
        return "ChecksumMismatch";
    case UpdateErrorKind::UnsafeArchive:
        return "UnsafeArchive";
    case UpdateErrorKind::CorruptArchive:
        return "CorruptArchive";
    case UpdateErrorKind::Layout:
        return "Layout";
    case UpdateErrorKind::Swap:
        return "Swap";
    case UpdateErrorKind::RollbackFailed:
        return "RollbackFailed";
    case UpdateErrorKind::Cancelled:
        return "Cancelled";
    case UpdateErrorKind::UpdateInProgress:
        return "UpdateInProgress";
    case UpdateErrorKind::NotPackaged:
        return "NotPackaged";
    }
    return "Unknown";
}

} // namespace updater
