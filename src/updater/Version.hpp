#pragma once

#include <compare>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace updater
{

inline constexpr const char* kDefaultProductPrefix = "cabplanner-";

// Semantic version (major.minor.patch[-prerelease])
class Version
{
public:
    // Pre-release identifier: numeric parts compare numerically, words lexically
    using Identifier = std::variant<unsigned long long, std::string>;

    // Construct from version string (e.g., "0.1.0", "v1.2.3", "cabplanner-1.2.0-rc.1")
    // Throws InvalidVersionError when the text is not a version
    explicit Version(const std::string& versionString);

    // Construct from components
    Version(int major, int minor, int patch);

    // Default constructor (0.0.0)
    Version();

    // Getters
    int major() const { return major_; }

    int minor() const { return minor_; }

    int patch() const { return patch_; }

    // Development releases count as pre-releases, post-releases do not
    bool isPrerelease() const { return !prerelease_.empty() || dev_.has_value(); }

    bool isPostRelease() const { return post_.has_value(); }

    bool isDevRelease() const { return dev_.has_value(); }

    // Pre-release label in normalized dotted form, e.g. "rc.1" (empty for releases)
    std::string prereleaseLabel() const;

    // Convert to normalized string (e.g., "0.1.0", "1.2.0-beta.2", "1.2.0.post1", "1.3.0.dev2")
    std::string toString() const;

    // Numeric core first, then
    //   X.devN < X-alpha < X-beta < X-rc < X < X.postN
    // and a ".devN" suffix sorts before the same version without it
    std::strong_ordering compare(const Version& other) const;

    std::strong_ordering operator<=>(const Version& other) const { return compare(other); }

    bool operator==(const Version& other) const { return compare(other) == 0; }

    // Strips whitespace, one leading "v" and one product prefix, then parses.
    // Throws InvalidVersionError on empty or unrecognized input.
    static Version parse(const std::string& versionString, const std::string& productPrefix = kDefaultProductPrefix);

    // Parse version string (returns true if valid)
    static bool tryParse(const std::string& versionString, Version& outVersion,
                         const std::string& productPrefix = kDefaultProductPrefix);

    // Prefix stripping only, exposed for display purposes
    static std::string normalizeTag(const std::string& versionString,
                                    const std::string& productPrefix = kDefaultProductPrefix);

private:
    int major_;
    int minor_;
    int patch_;
    std::vector<Identifier> prerelease_;
    std::optional<unsigned long long> post_;
    std::optional<unsigned long long> dev_;

    // Parse version string helper
    bool parseString(const std::string& versionString, const std::string& productPrefix);
};

// True only when both strings parse and latest > current. Never throws: a broken
// version string suppresses the update instead of failing the check.
bool isNewerVersion(const std::string& current, const std::string& latest,
                    const std::string& productPrefix = kDefaultProductPrefix);

} // namespace updater
