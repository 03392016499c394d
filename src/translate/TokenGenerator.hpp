#pragma once

#include "../utils/HttpCommon.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace translate
{

// Signing seed published on the service landing page as "hours.value"
struct TokenSeed
{
    std::int64_t hours = 0;
    std::int64_t value = 0;

    std::string toString() const { return std::to_string(hours) + "." + std::to_string(value); }

    bool operator==(const TokenSeed&) const = default;
};

using TokenFunction = std::function<std::string(const TokenSeed& seed, const std::string& utf8_text)>;

// Checksum the service expects in the tk parameter. Operates on the UTF-8
// expansion of the UTF-16 code units of the text.
std::string computeToken(const TokenSeed& seed, const std::string& utf8_text);

// Extracts the seed from landing page HTML; nullopt when no known pattern matches
std::optional<TokenSeed> parseSeed(const std::string& page);

std::int64_t currentEpochHours();

class TokenGenerator
{
public:
    struct Options
    {
        std::string seed_url = "https://translate.google.com/";
        std::string user_agent;
        SessionConfig session;
    };

    TokenGenerator(IHttpClient& http, Options options, TokenFunction fn = computeToken);

    // Always yields a token. When the seed is stale and cannot be refreshed the
    // token is computed from the old seed and isSeedObsolete() stays true.
    std::string generate(const std::string& text);

    bool isSeedObsolete() const;
    TokenSeed seed() const;

    // Clock is injectable for tests
    void setClock(std::function<std::int64_t()> epoch_hours) { clock_ = std::move(epoch_hours); }
    void setSeed(const TokenSeed& seed);

private:
    bool refreshSeed();

    IHttpClient& http_;
    Options options_;
    TokenFunction fn_;
    std::function<std::int64_t()> clock_ = currentEpochHours;

    mutable std::mutex seed_mtx_;
    TokenSeed seed_{};
    std::int64_t fetched_at_hours_ = -1;
};

} // namespace translate
