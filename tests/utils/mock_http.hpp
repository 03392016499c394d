#pragma once

#include "utils/HttpCommon.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace test_utils {

// Mock HTTP response structure
struct MockResponse {
    int status_code = 200;
    std::string body;
    std::string error_message;
    bool has_error = false;
    std::string set_cookie;
    int delay_ms = 0; // held before answering, outside the client's lock
};

struct RecordedRequest {
    std::string url;
    std::vector<translate::Header> headers;

    std::string header(const std::string& name) const;
};

// Scripted transport. Exact URLs win over patterns; patterns are tried in
// registration order; anything else gets a 404.
class MockHttpClient : public translate::IHttpClient {
public:
    translate::HttpResponse get(const std::string& url,
                                const std::vector<translate::Header>& headers,
                                const translate::SessionConfig& cfg) override;

    // Set response for a specific URL
    void setResponse(const std::string& url, const MockResponse& response);
    
    // Set response based on URL pattern matching (std::regex search)
    void setPatternResponse(const std::string& pattern, const MockResponse& response);

    // Responses handed out one per matching request; the last one repeats
    void setPatternSequence(const std::string& pattern, std::vector<MockResponse> responses);
    
    // Simulate a network error for all requests
    void simulateNetworkError(const std::string& error_msg);
    
    // Clear all mocked responses and the request log
    void clearResponses();
    
    // Get mocked response for URL
    MockResponse getResponse(const std::string& url);

    std::vector<RecordedRequest> requests() const;
    std::size_t requestCount() const;
    std::size_t countMatching(const std::string& pattern) const;
    
private:
    struct PatternEntry {
        std::string pattern;
        std::vector<MockResponse> responses;
        std::size_t served = 0;
    };

    mutable std::mutex mtx_;
    std::unordered_map<std::string, MockResponse> url_responses_;
    std::vector<PatternEntry> pattern_responses_;
    std::vector<RecordedRequest> requests_;
    bool simulate_error_ = false;
    std::string error_message_;
};

// Common mock responses for testing
class MockResponses {
public:
    // Landing page carrying the signing seed
    static MockResponse landing_page(const std::string& seed);
    static MockResponse landing_page_without_seed();

    // translate_a/single bodies
    static MockResponse single_success(const std::string& translated_text,
                                       const std::string& original_text,
                                       const std::string& source_lang);
    static MockResponse single_body(const std::string& body);
    static MockResponse single_invalid_json();

    // Service refusing the client
    static MockResponse error_429();
    static MockResponse error_503();

    // Generic error responses
    static MockResponse network_error();
    static MockResponse timeout_error();
};

}  // namespace test_utils
