#pragma once

#include "UpdateTypes.hpp"

#include <string>

namespace updater
{

// Capability interface for the remote release registry
class IReleaseSource
{
public:
    virtual ~IReleaseSource() = default;

    // Latest published release of repoId ("owner/name").
    // Throws NetworkError when the registry cannot be reached and
    // MalformedResponseError when required fields are missing.
    virtual ReleaseDescriptor fetchLatest(const std::string& repoId) = 0;
};

} // namespace updater
