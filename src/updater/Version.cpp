#include "Version.hpp"
#include "UpdateErrors.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>
#include <sstream>

namespace updater
{

namespace
{

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool startsWith(const std::string& text, const std::string& prefix)
{
    return !prefix.empty() && text.compare(0, prefix.size(), prefix) == 0;
}

std::string canonicalWord(std::string word)
{
    std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) { return std::tolower(c); });

    // PEP 440 spellings used by older release tags
    if (word == "a")
        return "alpha";
    if (word == "b")
        return "beta";
    if (word == "c" || word == "pre" || word == "preview")
        return "rc";
    if (word == "r" || word == "rev")
        return "post";
    return word;
}

// "rc1" -> {"rc", 1}, "beta.2" -> {"beta", 2}
std::vector<Version::Identifier> splitPrerelease(const std::string& label)
{
    std::vector<Version::Identifier> ids;
    std::string current;
    bool currentIsDigit = false;

    auto flush = [&]()
    {
        if (current.empty())
            return;
        if (currentIsDigit)
            ids.emplace_back(std::stoull(current));
        else
            ids.emplace_back(canonicalWord(current));
        current.clear();
    };

    for (char ch : label)
    {
        if (ch == '.' || ch == '-' || ch == '_')
        {
            flush();
            continue;
        }

        const bool isDigit = std::isdigit(static_cast<unsigned char>(ch)) != 0;
        if (!current.empty() && isDigit != currentIsDigit)
            flush();
        currentIsDigit = isDigit;
        current.push_back(ch);
    }
    flush();
    return ids;
}

// Removes "<word> [N]" from ids and returns N (0 when the number is omitted)
std::optional<unsigned long long> takeSegment(std::vector<Version::Identifier>& ids, const std::string& word)
{
    for (auto it = ids.begin(); it != ids.end(); ++it)
    {
        const auto* text = std::get_if<std::string>(&*it);
        if (!text || *text != word)
            continue;

        unsigned long long number = 0;
        auto last = std::next(it);
        if (last != ids.end())
        {
            if (const auto* value = std::get_if<unsigned long long>(&*last))
            {
                number = *value;
                ++last;
            }
        }
        ids.erase(it, last);
        return number;
    }
    return std::nullopt;
}

// Absent ranks above any number for dev, below any number for post
std::strong_ordering compareOptional(const std::optional<unsigned long long>& lhs,
                                     const std::optional<unsigned long long>& rhs, bool absentIsHigher)
{
    if (lhs && rhs)
        return *lhs <=> *rhs;
    if (lhs.has_value() == rhs.has_value())
        return std::strong_ordering::equal;
    const bool lhsAbsent = !lhs.has_value();
    return lhsAbsent == absentIsHigher ? std::strong_ordering::greater : std::strong_ordering::less;
}

std::strong_ordering compareIdentifier(const Version::Identifier& lhs, const Version::Identifier& rhs)
{
    const bool lhsNumeric = std::holds_alternative<unsigned long long>(lhs);
    const bool rhsNumeric = std::holds_alternative<unsigned long long>(rhs);

    if (lhsNumeric && rhsNumeric)
        return std::get<unsigned long long>(lhs) <=> std::get<unsigned long long>(rhs);

    // Numeric identifiers have lower precedence than alphanumeric ones
    if (lhsNumeric != rhsNumeric)
        return lhsNumeric ? std::strong_ordering::less : std::strong_ordering::greater;

    const int cmp = std::get<std::string>(lhs).compare(std::get<std::string>(rhs));
    if (cmp < 0)
        return std::strong_ordering::less;
    if (cmp > 0)
        return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

} // namespace

Version::Version() : major_(0), minor_(0), patch_(0)
{
}

Version::Version(int major, int minor, int patch) : major_(major), minor_(minor), patch_(patch)
{
}

Version::Version(const std::string& versionString) : major_(0), minor_(0), patch_(0)
{
    if (!parseString(versionString, kDefaultProductPrefix))
    {
        throw InvalidVersionError("Invalid version string: '" + versionString + "'");
    }
}

std::string Version::prereleaseLabel() const
{
    std::ostringstream oss;
    for (size_t i = 0; i < prerelease_.size(); ++i)
    {
        if (i > 0)
            oss << '.';
        std::visit([&oss](const auto& value) { oss << value; }, prerelease_[i]);
    }
    return oss.str();
}

std::string Version::toString() const
{
    std::ostringstream oss;
    oss << major_ << "." << minor_ << "." << patch_;
    if (!prerelease_.empty())
    {
        oss << "-" << prereleaseLabel();
    }
    if (post_)
    {
        oss << ".post" << *post_;
    }
    if (dev_)
    {
        oss << ".dev" << *dev_;
    }
    return oss.str();
}

std::strong_ordering Version::compare(const Version& other) const
{
    if (auto cmp = major_ <=> other.major_; cmp != 0)
        return cmp;
    if (auto cmp = minor_ <=> other.minor_; cmp != 0)
        return cmp;
    if (auto cmp = patch_ <=> other.patch_; cmp != 0)
        return cmp;

    // 0: bare development release, 1: pre-release, 2: release or post-release
    auto stage = [](const Version& v)
    {
        if (!v.prerelease_.empty())
            return 1;
        return (v.dev_ && !v.post_) ? 0 : 2;
    };
    if (auto cmp = stage(*this) <=> stage(other); cmp != 0)
        return cmp;

    const size_t common = std::min(prerelease_.size(), other.prerelease_.size());
    for (size_t i = 0; i < common; ++i)
    {
        if (auto cmp = compareIdentifier(prerelease_[i], other.prerelease_[i]); cmp != 0)
            return cmp;
    }
    if (auto cmp = prerelease_.size() <=> other.prerelease_.size(); cmp != 0)
        return cmp;

    if (auto cmp = compareOptional(post_, other.post_, false); cmp != 0)
        return cmp;
    return compareOptional(dev_, other.dev_, true);
}

Version Version::parse(const std::string& versionString, const std::string& productPrefix)
{
    Version version;
    if (!version.parseString(versionString, productPrefix))
    {
        throw InvalidVersionError("Invalid version string: '" + versionString + "'");
    }
    return version;
}

bool Version::tryParse(const std::string& versionString, Version& outVersion, const std::string& productPrefix)
{
    Version parsed;
    if (!parsed.parseString(versionString, productPrefix))
        return false;
    outVersion = std::move(parsed);
    return true;
}

std::string Version::normalizeTag(const std::string& versionString, const std::string& productPrefix)
{
    std::string cleaned = trim(versionString);

    // Each prefix is stripped at most once, in either order ("v" + prefix or prefix + "v")
    bool strippedV = false;
    if (startsWith(cleaned, "v"))
    {
        cleaned.erase(0, 1);
        strippedV = true;
    }
    if (startsWith(cleaned, productPrefix))
    {
        cleaned.erase(0, productPrefix.size());
    }
    if (!strippedV && startsWith(cleaned, "v"))
    {
        cleaned.erase(0, 1);
    }
    return cleaned;
}

bool Version::parseString(const std::string& versionString, const std::string& productPrefix)
{
    // Support formats:
    // - "1.2.3", "1.2" (patch defaults to 0), "1" (minor and patch default to 0)
    // - "v1.2.3", "cabplanner-1.2.3", "cabplanner-v1.2.3"
    // - "1.2.3-beta.2", "1.2.3rc1", "1.2.3-rc1+build.5" (build metadata is ignored)
    // - "1.2.3.post1", "1.2.3.dev4", "1.2.3rc1.dev2"
    const std::string cleaned = normalizeTag(versionString, productPrefix);
    if (cleaned.empty())
        return false;

    static const std::regex versionRegex(
        R"(^(\d+)(?:\.(\d+))?(?:\.(\d+))?(?:[-_]([0-9A-Za-z]+(?:[.\-_][0-9A-Za-z]+)*)|\.?([A-Za-z][0-9A-Za-z]*(?:[.\-_][0-9A-Za-z]+)*))?(?:\+[0-9A-Za-z.\-]+)?$)");
    std::smatch match;

    if (!std::regex_match(cleaned, match, versionRegex))
        return false;

    try
    {
        major_ = std::stoi(match[1].str());
        minor_ = match[2].matched ? std::stoi(match[2].str()) : 0;
        patch_ = match[3].matched ? std::stoi(match[3].str()) : 0;

        prerelease_.clear();
        if (match[4].matched)
            prerelease_ = splitPrerelease(match[4].str());
        else if (match[5].matched)
            prerelease_ = splitPrerelease(match[5].str());
        post_ = takeSegment(prerelease_, "post");
        dev_ = takeSegment(prerelease_, "dev");
        return true;
    }
    catch (const std::exception&)
    {
        // Component does not fit into an int
        return false;
    }
}

bool isNewerVersion(const std::string& current, const std::string& latest, const std::string& productPrefix)
{
    try
    {
        const Version currentVersion = Version::parse(current, productPrefix);
        const Version latestVersion = Version::parse(latest, productPrefix);
        return latestVersion > currentVersion;
    }
    catch (const InvalidVersionError& e)
    {
        PLOG_ERROR << "Version comparison failed: " << e.what();
        return false;
    }
}

} // namespace updater
