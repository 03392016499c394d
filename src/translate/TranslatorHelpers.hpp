#pragma once
#include "../utils/HttpCommon.hpp"

#include <algorithm>
#include <mutex>
#include <random>
#include <string>
#include <utility>

namespace translate
{
namespace helpers
{

// What the translator does after the main request came back
enum class FailureAction
{
    None,                // success, decode the body
    RetryWithFreshToken, // seed went stale, run the whole operation again
    IpBanned,            // service refused us at the HTTP level
    Propagate            // transport error, hand it to the caller
};

// Only one stale-seed retry is ever granted
constexpr int kMaxSeedRetries = 1;

inline FailureAction classify_failure(const HttpResponse& r, bool seed_obsolete, int attempt)
{
    if (r.ok())
        return FailureAction::None;
    if (seed_obsolete && attempt < kMaxSeedRetries)
        return FailureAction::RetryWithFreshToken;
    if (r.failure() == TransportFailure::Protocol)
        return FailureAction::IpBanned;
    return FailureAction::Propagate;
}

// Categorize HTTP errors
enum class HttpErrorType
{
    Success,
    Timeout,
    TooManyRequests,
    NetworkError,
    ServerError,
    ClientError,
    Other
};

inline HttpErrorType categorize_http_error(int status_code, const std::string& error_msg)
{
    if (!error_msg.empty())
    {
        // Network/transport errors
        if (error_msg.find("timeout") != std::string::npos || error_msg.find("Timeout") != std::string::npos ||
            error_msg.find("timed out") != std::string::npos)
        {
            return HttpErrorType::Timeout;
        }
        return HttpErrorType::NetworkError;
    }

    if (status_code >= 200 && status_code < 300)
    {
        return HttpErrorType::Success;
    }

    switch (status_code)
    {
    case 408: // Request Timeout
    case 504: // Gateway Timeout
        return HttpErrorType::Timeout;
    case 429:
        return HttpErrorType::TooManyRequests;
    case 400:
    case 401:
    case 403:
    case 404:
        return HttpErrorType::ClientError;
    default:
        if (status_code >= 500)
            return HttpErrorType::ServerError;
        return HttpErrorType::Other;
    }
}

inline std::string get_error_description(HttpErrorType type, int status_code, const std::string& text_snippet)
{
    switch (type)
    {
    case HttpErrorType::Timeout:
        if (status_code == 0)
            return "Request timeout: " + text_snippet;
        return "Request timeout (HTTP " + std::to_string(status_code) + ")";
    case HttpErrorType::TooManyRequests:
        return "HTTP 429 Too Many Requests - the service is rate limiting this address";
    case HttpErrorType::NetworkError:
        return "Network error: " + text_snippet;
    case HttpErrorType::ServerError:
        return "Server error (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    case HttpErrorType::ClientError:
        return "Client error (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    default:
        return "HTTP " + std::to_string(status_code) + ": " + text_snippet;
    }
}

inline std::string describe_failure(const HttpResponse& r, const std::string& text_snippet)
{
    auto type = categorize_http_error(r.error.empty() ? r.status_code : 0, r.error);
    return get_error_description(type, r.status_code, r.error.empty() ? text_snippet : r.error);
}

// Random pause in [min_ms, max_ms] before each translation request.
// Shared engine, safe to call from several threads.
inline int courtesy_delay_ms(int min_ms, int max_ms)
{
    if (max_ms <= 0)
        return 0;
    min_ms = std::max(0, min_ms);
    if (min_ms > max_ms)
        std::swap(min_ms, max_ms);

    static std::mutex mtx;
    static std::mt19937 engine{ std::random_device{}() };
    std::lock_guard<std::mutex> lk(mtx);
    return std::uniform_int_distribution<int>(min_ms, max_ms)(engine);
}

} // namespace helpers
} // namespace translate
