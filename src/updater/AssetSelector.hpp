#pragma once

#include "UpdateTypes.hpp"

#include <string>
#include <vector>

namespace updater
{

// How to break ties between equally suitable assets
enum class SizePreference
{
    Larger, // A bundled onedir package is assumed larger than a thin build
    Smaller,
    FirstListed
};

bool parseSizePreference(const std::string& label, SizePreference& out);
const char* toString(SizePreference preference);

struct AssetSelectionPolicy
{
    std::vector<std::string> platformMarkers; // Lowercase substrings naming the target platform
    std::vector<std::string> sourceMarkers; // Lowercase substrings naming source archives
    std::vector<std::string> archiveExtensions; // Formats the extractor can open
    SizePreference sizePreference = SizePreference::Larger;

    // Markers for a target platform label ("windows", "linux", "macos")
    static AssetSelectionPolicy forPlatform(const std::string& platform);
};

class AssetSelector
{
public:
    explicit AssetSelector(AssetSelectionPolicy policy);

    // Picks exactly one asset; throws NoSuitableAssetError when none qualifies
    const AssetDescriptor& select(const std::vector<AssetDescriptor>& assets) const;

    bool isInstallable(const AssetDescriptor& asset) const;
    bool isSourceArchive(const AssetDescriptor& asset) const;
    bool matchesPlatform(const AssetDescriptor& asset) const;

    const AssetSelectionPolicy& policy() const { return policy_; }

private:
    AssetSelectionPolicy policy_;
};

} // namespace updater
