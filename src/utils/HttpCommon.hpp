#pragma once

#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace translate
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 30000;
    std::atomic<bool>* cancel_flag = nullptr;

    // Empty means direct connection; applied to both http and https
    std::string proxy;
};

enum class TransportFailure
{
    None,
    Network,  // no HTTP response: DNS, connect, TLS, timeout, cancel
    Protocol  // server answered with a non-success status
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors
    std::string set_cookie;

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }

    TransportFailure failure() const
    {
        if (!error.empty())
            return TransportFailure::Network;
        if (status_code < 200 || status_code >= 300)
            return TransportFailure::Protocol;
        return TransportFailure::None;
    }
};

// Transport seam for everything that talks to the translation service
class IHttpClient
{
public:
    virtual ~IHttpClient() = default;
    virtual HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg) = 0;
};

class CprHttpClient : public IHttpClient
{
public:
    HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg) override;
};

// Simple GET helper
HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg);

// RFC 3986 unreserved characters pass through, everything else is %XX
std::string url_escape(const std::string& s);

} // namespace translate
