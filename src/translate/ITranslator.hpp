#pragma once

#include "TranslateError.hpp"
#include "TranslationResult.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace translate
{
    struct TranslateOutcome
    {
        TranslationResult result;
        TranslateError error = TranslateError::None;
        std::string message;

        bool ok() const { return error == TranslateError::None; }
    };

    struct TranslatorConfig
    {
        std::string domain = "translate.google.com";
        std::string handshake_url = "http://translate.google.nl/";
        std::string seed_url = "https://translate.google.com/";
        std::string user_agent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:61.0) Gecko/20100101 Firefox/61.0";
        std::string proxy;
        int timeout_ms = 30000;
        int connect_timeout_ms = 5000;
        int courtesy_delay_min_ms = 200;
        int courtesy_delay_max_ms = 500;
        std::string languages_file;
    };

    struct Completed
    {
        std::uint64_t id = 0;
        TranslationResult result;
        bool failed = false;
        TranslateError error = TranslateError::None;
        std::string original_text;
        std::string error_message;
    };

    class ITranslator
    {
    public:
        virtual ~ITranslator() = default;
        virtual bool init(const TranslatorConfig& cfg) = 0;
        virtual bool isReady() const = 0;
        virtual void shutdown() = 0;
        virtual bool submit(const std::string& text, const std::string& src_lang, const std::string& dst_lang, bool lite, std::uint64_t& out_id) = 0;
        virtual bool drain(std::vector<Completed>& out) = 0;
        virtual const char* lastError() const = 0;
        virtual std::string testConnection() = 0;
    };
}
