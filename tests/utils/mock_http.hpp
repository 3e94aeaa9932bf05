#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace test_utils {

// Mock HTTP response structure
struct MockResponse {
    int status_code = 200;
    std::string body;
    std::string error_message;
    bool has_error = false;
};

// Mock HTTP client for testing
class MockHttpClient {
public:
    // Set response for a specific URL
    void setResponse(const std::string& url, const MockResponse& response);

    // Set response based on URL pattern matching
    void setPatternResponse(const std::string& pattern, const MockResponse& response);

    // Simulate a network error for all requests
    void simulateNetworkError(const std::string& error_msg);

    // Clear all mocked responses
    void clearResponses();

    // Get mocked response for URL
    MockResponse getResponse(const std::string& url) const;

    // URLs requested so far
    const std::vector<std::string>& requests() const { return requests_; }

    MockResponse get(const std::string& url);

private:
    std::unordered_map<std::string, MockResponse> url_responses_;
    std::unordered_map<std::string, MockResponse> pattern_responses_;
    std::vector<std::string> requests_;
    bool simulate_error_ = false;
    std::string error_message_;
};

struct MockAsset {
    std::string name;
    unsigned long long size = 0;
    std::string digest; // "sha256:<hex>", omitted when empty
};

// Canned GitHub Releases API responses
class MockResponses {
public:
    static MockResponse github_release(const std::string& tag, const std::vector<MockAsset>& assets,
                                       bool prerelease = false);
    static MockResponse github_release_null_name(const std::string& tag);
    static MockResponse github_missing_tag();
    static MockResponse github_asset_without_size();
    static MockResponse github_invalid_json();
    static MockResponse github_not_found();
    static MockResponse github_rate_limited();

    // Transport failure as reported for an expired request timeout
    static MockResponse timeout_error();
};

}  // namespace test_utils
