#include "AssetSelector.hpp"
#include "UpdateErrors.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>

namespace updater
{

namespace
{

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

bool containsAny(const std::string& haystack, const std::vector<std::string>& needles)
{
    return std::any_of(needles.begin(), needles.end(),
                       [&](const std::string& needle) { return !needle.empty() && haystack.find(needle) != std::string::npos; });
}

bool endsWith(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool parseSizePreference(const std::string& label, SizePreference& out)
{
    const std::string lowered = toLower(label);
    if (lowered == "larger")
        out = SizePreference::Larger;
    else if (lowered == "smaller")
        out = SizePreference::Smaller;
    else if (lowered == "first")
        out = SizePreference::FirstListed;
    else
        return false;
    return true;
}

const char* toString(SizePreference preference)
{
    switch (preference)
    {
    case SizePreference::Larger:
        return "larger";
    case SizePreference::Smaller:
        return "smaller";
    case SizePreference::FirstListed:
        return "first";
    }
    return "larger";
}

AssetSelectionPolicy AssetSelectionPolicy::forPlatform(const std::string& platform)
{
    AssetSelectionPolicy policy;
    const std::string lowered = toLower(platform);

    if (lowered == "windows" || lowered == "win" || lowered == "win64")
        policy.platformMarkers = { "windows", "win64", "win32", "-win", "_win" };
    else if (lowered == "macos" || lowered == "darwin" || lowered == "osx")
        policy.platformMarkers = { "macos", "darwin", "osx" };
    else if (!lowered.empty())
        policy.platformMarkers = { lowered };

    policy.sourceMarkers = { "source", "src" };
    policy.archiveExtensions = { ".zip" };
    return policy;
}

AssetSelector::AssetSelector(AssetSelectionPolicy policy)
    : policy_(std::move(policy))
{
}

bool AssetSelector::isInstallable(const AssetDescriptor& asset) const
{
    const std::string name = toLower(asset.name);
    return std::any_of(policy_.archiveExtensions.begin(), policy_.archiveExtensions.end(),
                       [&](const std::string& ext) { return endsWith(name, toLower(ext)); });
}

bool AssetSelector::isSourceArchive(const AssetDescriptor& asset) const
{
    return containsAny(toLower(asset.name), policy_.sourceMarkers);
}

bool AssetSelector::matchesPlatform(const AssetDescriptor& asset) const
{
    return containsAny(toLower(asset.name), policy_.platformMarkers);
}

const AssetDescriptor& AssetSelector::select(const std::vector<AssetDescriptor>& assets) const
{
    std::vector<const AssetDescriptor*> platformSpecific;
    std::vector<const AssetDescriptor*> generic;

    for (const auto& asset : assets)
    {
        if (!isInstallable(asset))
        {
            PLOG_DEBUG << "Skipping asset with unsupported format: " << asset.name;
            continue;
        }
        if (isSourceArchive(asset))
        {
            PLOG_DEBUG << "Skipping source archive: " << asset.name;
            continue;
        }
        (matchesPlatform(asset) ? platformSpecific : generic).push_back(&asset);
    }

    const auto& pool = platformSpecific.empty() ? generic : platformSpecific;
    if (pool.empty())
    {
        PLOG_ERROR << "No suitable package among " << assets.size() << " release assets";
        throw NoSuitableAssetError("No installable package found in the release");
    }

    // Stable pick: on equal sizes the earlier listing wins
    const AssetDescriptor* chosen = pool.front();
    for (const AssetDescriptor* candidate : pool)
    {
        if (policy_.sizePreference == SizePreference::Larger && candidate->size > chosen->size)
            chosen = candidate;
        else if (policy_.sizePreference == SizePreference::Smaller && candidate->size < chosen->size)
            chosen = candidate;
    }

    if (pool.size() > 1)
    {
        PLOG_WARNING << pool.size() << " candidate packages in release, picked " << chosen->name << " (prefer "
                     << toString(policy_.sizePreference) << ")";
    }
    PLOG_INFO << "Selected asset: " << chosen->name << " (" << chosen->size << " bytes)";
    return *chosen;
}

} // namespace updater
