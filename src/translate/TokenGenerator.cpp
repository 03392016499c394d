#include "TokenGenerator.hpp"
#include "../utils/Diagnostics.hpp"

#include <plog/Log.h>

#include <chrono>
#include <regex>
#include <string_view>
#include <vector>

namespace translate
{

namespace
{

std::int64_t toInt32(std::int64_t x) { return static_cast<std::int32_t>(static_cast<std::uint32_t>(x)); }

// One pass of the service's shift/add/xor mixer. Each op is three chars:
// combine ('+' add, '^' xor), direction ('+' logical right, '-' left), amount (hex digit).
std::int64_t mix(std::int64_t a, std::string_view ops)
{
    for (std::size_t c = 0; c + 2 < ops.size(); c += 3)
    {
        const char k = ops[c + 2];
        const int shift = k >= 'a' ? k - 87 : k - '0';
        const std::int64_t d = ops[c + 1] == '+'
                                   ? static_cast<std::int64_t>(static_cast<std::uint32_t>(a) >> shift)
                                   : toInt32(static_cast<std::uint32_t>(a) << shift);
        a = ops[c] == '+' ? toInt32(a + d) : (toInt32(a) ^ toInt32(d));
    }
    return a;
}

std::vector<std::uint16_t> toUtf16(const std::string& s)
{
    std::vector<std::uint16_t> out;
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size())
    {
        const auto c = static_cast<unsigned char>(s[i]);
        std::uint32_t cp = 0xFFFD;
        std::size_t len = 1;
        if (c < 0x80)
        {
            cp = c;
        }
        else if ((c & 0xE0) == 0xC0)
        {
            cp = c & 0x1F;
            len = 2;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            cp = c & 0x0F;
            len = 3;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            cp = c & 0x07;
            len = 4;
        }

        if (len > 1)
        {
            if (i + len > s.size())
            {
                cp = 0xFFFD;
                len = 1;
            }
            else
            {
                for (std::size_t j = 1; j < len; ++j)
                {
                    const auto cc = static_cast<unsigned char>(s[i + j]);
                    if ((cc & 0xC0) != 0x80)
                    {
                        cp = 0xFFFD;
                        len = j;
                        break;
                    }
                    cp = (cp << 6) | (cc & 0x3F);
                }
            }
        }

        if (cp >= 0x10000)
        {
            cp -= 0x10000;
            out.push_back(static_cast<std::uint16_t>(0xD800 + (cp >> 10)));
            out.push_back(static_cast<std::uint16_t>(0xDC00 + (cp & 0x3FF)));
        }
        else
        {
            out.push_back(static_cast<std::uint16_t>(cp));
        }
        i += len;
    }
    return out;
}

// Byte expansion the service applies before mixing; a lone surrogate is
// encoded as a three byte sequence instead of being rejected.
std::vector<std::uint32_t> expandCodeUnits(const std::vector<std::uint16_t>& units)
{
    std::vector<std::uint32_t> bytes;
    bytes.reserve(units.size() * 3);
    for (std::size_t g = 0; g < units.size(); ++g)
    {
        std::uint32_t l = units[g];
        if (l < 128)
        {
            bytes.push_back(l);
            continue;
        }
        if (l < 2048)
        {
            bytes.push_back(l >> 6 | 192);
        }
        else
        {
            if ((l & 0xFC00) == 0xD800 && g + 1 < units.size() && (units[g + 1] & 0xFC00) == 0xDC00)
            {
                ++g;
                l = 65536 + ((l & 1023) << 10) + (units[g] & 1023);
                bytes.push_back(l >> 18 | 240);
                bytes.push_back((l >> 12 & 63) | 128);
            }
            else
            {
                bytes.push_back(l >> 12 | 224);
            }
            bytes.push_back((l >> 6 & 63) | 128);
        }
        bytes.push_back((l & 63) | 128);
    }
    return bytes;
}

} // namespace

std::string computeToken(const TokenSeed& seed, const std::string& utf8_text)
{
    std::int64_t a = seed.hours;
    for (std::uint32_t byte : expandCodeUnits(toUtf16(utf8_text)))
    {
        a += byte;
        a = mix(a, "+-a^+6");
    }
    a = mix(a, "+-3^+b+-f");
    a = toInt32(a) ^ toInt32(seed.value);
    if (a < 0)
        a = (a & 2147483647) + 2147483648LL;
    a %= 1000000;
    return std::to_string(a) + "." + std::to_string(toInt32(a) ^ toInt32(seed.hours));
}

std::optional<TokenSeed> parseSeed(const std::string& page)
{
    static const std::regex kPlain(R"([tT][kK][kK]\s*[:=]\s*'(\d+)\.(-?\d+)')");
    static const std::regex kEval(
        R"(TKK=eval\('\(\(function\(\)\{var a\\x3d(-?\d+);var b\\x3d(-?\d+);return (\d+)\+)");

    std::smatch m;
    try
    {
        if (std::regex_search(page, m, kPlain))
            return TokenSeed{ std::stoll(m[1].str()), std::stoll(m[2].str()) };
        if (std::regex_search(page, m, kEval))
            return TokenSeed{ std::stoll(m[3].str()), std::stoll(m[1].str()) + std::stoll(m[2].str()) };
    }
    catch (const std::out_of_range&)
    {
        PLOG_WARNING << "Signing seed digits out of range";
    }
    return std::nullopt;
}

std::int64_t currentEpochHours()
{
    using namespace std::chrono;
    return duration_cast<hours>(system_clock::now().time_since_epoch()).count();
}

TokenGenerator::TokenGenerator(IHttpClient& http, Options options, TokenFunction fn)
    : http_(http)
    , options_(std::move(options))
    , fn_(std::move(fn))
{
}

std::string TokenGenerator::generate(const std::string& text)
{
    if (isSeedObsolete())
        refreshSeed();
    return fn_(seed(), text);
}

bool TokenGenerator::isSeedObsolete() const
{
    std::lock_guard<std::mutex> lk(seed_mtx_);
    return fetched_at_hours_ != clock_();
}

TokenSeed TokenGenerator::seed() const
{
    std::lock_guard<std::mutex> lk(seed_mtx_);
    return seed_;
}

void TokenGenerator::setSeed(const TokenSeed& seed)
{
    std::lock_guard<std::mutex> lk(seed_mtx_);
    seed_ = seed;
    fetched_at_hours_ = clock_();
}

bool TokenGenerator::refreshSeed()
{
    std::vector<Header> headers;
    if (!options_.user_agent.empty())
        headers.push_back({ "User-Agent", options_.user_agent });

    auto r = http_.get(options_.seed_url, headers, options_.session);
    if (!r.ok())
    {
        PLOG_WARNING << "Signing seed refresh failed: "
                     << (r.error.empty() ? "HTTP " + std::to_string(r.status_code) : r.error);
        return false;
    }

    auto parsed = parseSeed(r.text);
    if (!parsed)
    {
        PLOG_WARNING << "No signing seed found on " << options_.seed_url;
        PLOG_DEBUG << "Landing page: " << utils::Diagnostics::Preview(r.text);
        return false;
    }

    PLOG_DEBUG << "Signing seed refreshed: " << parsed->toString();
    setSeed(*parsed);
    return true;
}

} // namespace translate
