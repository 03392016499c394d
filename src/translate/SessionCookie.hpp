#pragma once

#include "../utils/HttpCommon.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace translate
{

// Session cookie handed out by the landing page. One handshake per instance;
// any later Set-Cookie replaces the cached value (last write wins).
class SessionCookie
{
public:
    // Sent while no cookie has been obtained
    static constexpr const char* kFallbackCookie =
        "NID=132=YSV6D_1_0-kurlU0FU1_McKljflccBTuJEM4tGzFWw8nZm90f-P7bzqrFnETlu4LLDf5GMwAD2oiRicTUeP_"
        "fftLO7Xy2OH0Vz2MerRlalbfmfHOf1Lrn3EN-_C3Pk2Y; CONSENT=WP.26e489; 1P_JAR=2018-6-18-12; "
        "_ga=GA1.3.737450149.1529324066; _gid=GA1.3.606173287.1529324066";

    struct Options
    {
        std::string handshake_url = "http://translate.google.nl/";
        std::string host = "translate.google.com";
        std::string user_agent;
        SessionConfig session;
    };

    SessionCookie(IHttpClient& http, Options options);

    // Performs the handshake only while nothing is cached. Transport failures
    // are logged and leave the cookie unset.
    void ensureCookie();

    // Replaces the cached cookie when set_cookie is non-empty
    void update(const std::string& set_cookie);

    bool hasCookie() const;
    std::optional<std::string> raw() const;

    // Value for the Cookie request header
    std::string headerValue() const;

    // Keeps name=value pairs from a Set-Cookie header and drops attributes
    static std::string toCookieHeader(const std::string& set_cookie);

private:
    IHttpClient& http_;
    Options options_;

    mutable std::mutex mtx_;
    std::optional<std::string> cookie_;
};

} // namespace translate
