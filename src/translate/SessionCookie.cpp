#include "SessionCookie.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace translate
{

namespace
{

std::string trim(std::string_view s)
{
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))
        s.remove_suffix(1);
    return std::string(s);
}

bool isCookieAttribute(std::string name)
{
    static constexpr std::array<std::string_view, 8> kAttributes{ "expires", "path",     "domain",   "max-age",
                                                                  "secure",  "httponly", "samesite", "priority" };
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(kAttributes.begin(), kAttributes.end(), name) != kAttributes.end();
}

} // namespace

SessionCookie::SessionCookie(IHttpClient& http, Options options)
    : http_(http)
    , options_(std::move(options))
{
}

void SessionCookie::ensureCookie()
{
    if (hasCookie())
        return;

    std::vector<Header> headers{
        { "Accept",          "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8" },
        { "Accept-Encoding", "gzip,deflate"                                                      },
        { "Accept-Charset",  "ISO-8859-1,utf-8;q=0.7,*;q=0.7"                                    },
        { "Accept-Language", "en-US,en;q=0.5"                                                    },
        { "Host",            options_.host                                                       },
    };
    if (!options_.user_agent.empty())
        headers.push_back({ "User-Agent", options_.user_agent });

    auto r = http_.get(options_.handshake_url, headers, options_.session);
    if (!r.error.empty())
    {
        PLOG_WARNING << "Session handshake failed, using fallback cookie: " << r.error;
        return;
    }
    if (r.set_cookie.empty())
    {
        PLOG_DEBUG << "Session handshake returned HTTP " << r.status_code << " without a cookie";
        return;
    }

    update(r.set_cookie);
    PLOG_INFO << "Session cookie obtained";
}

void SessionCookie::update(const std::string& set_cookie)
{
    if (set_cookie.empty())
        return;
    std::lock_guard<std::mutex> lk(mtx_);
    cookie_ = set_cookie;
}

bool SessionCookie::hasCookie() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return cookie_.has_value();
}

std::optional<std::string> SessionCookie::raw() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return cookie_;
}

std::string SessionCookie::headerValue() const
{
    auto cached = raw();
    if (!cached)
        return kFallbackCookie;
    std::string value = toCookieHeader(*cached);
    return value.empty() ? std::string(kFallbackCookie) : value;
}

std::string SessionCookie::toCookieHeader(const std::string& set_cookie)
{
    // Several cookies may arrive folded into one header separated by ','; the
    // comma inside "expires=Wed, 21 Oct ..." only yields a fragment without '='.
    std::string out;
    std::size_t start = 0;
    while (start <= set_cookie.size())
    {
        std::size_t end = set_cookie.find_first_of(";,", start);
        if (end == std::string::npos)
            end = set_cookie.size();

        std::string part = trim(std::string_view(set_cookie).substr(start, end - start));
        std::size_t eq = part.find('=');
        if (eq != std::string::npos && eq > 0)
        {
            std::string name = trim(std::string_view(part).substr(0, eq));
            if (!isCookieAttribute(name))
            {
                if (!out.empty())
                    out += "; ";
                out += name;
                out += '=';
                out += trim(std::string_view(part).substr(eq + 1));
            }
        }
        start = end + 1;
    }
    return out;
}

} // namespace translate
