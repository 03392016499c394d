#pragma once

#include "ITranslator.hpp"
#include "Language.hpp"
#include "SessionCookie.hpp"
#include "TokenGenerator.hpp"
#include "../utils/HttpCommon.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <queue>

namespace translate
{
    // Client for the translate_a/single endpoint of the web translator.
    // Synchronous calls run on the caller's thread; init() additionally starts
    // a worker thread that serves submit()/drain().
    class GoogleTranslator : public ITranslator
    {
    public:
        GoogleTranslator();
        explicit GoogleTranslator(IHttpClient& http);
        ~GoogleTranslator() override;

        // Applies cfg without starting the worker. Fails only when
        // cfg.languages_file is set and cannot be loaded.
        bool configure(const TranslatorConfig& cfg);

        TranslateOutcome translate(const std::string& text, const Language& from, const Language& to);
        TranslateOutcome translateLite(const std::string& text, const Language& from, const Language& to);
        TranslateOutcome translate(const std::string& text, const std::string& from_iso, const std::string& to_iso);
        TranslateOutcome translateLite(const std::string& text, const std::string& from_iso, const std::string& to_iso);

        bool init(const TranslatorConfig& cfg) override;
        bool isReady() const override;
        void shutdown() override;
        bool submit(const std::string& text, const std::string& src_lang, const std::string& dst_lang, bool lite, std::uint64_t& out_id) override;
        bool drain(std::vector<Completed>& out) override;
        const char* lastError() const override { return last_error_.c_str(); }
        std::string testConnection() override;

        // "auto" maps to the auto-detect sentinel; unknown codes come back
        // unresolved and are rejected when a request is built.
        Language resolve(const std::string& iso) const;

        const LanguageCatalog& catalog() const { return catalog_; }
        const TranslatorConfig& config() const { return cfg_; }
        SessionCookie& sessionCookie() { return *cookie_; }
        TokenGenerator& tokenGenerator() { return *tokens_; }

    private:
        struct Job
        {
            std::uint64_t id = 0;
            std::string text;
            std::string src;
            std::string dst;
            bool lite = false;
        };

        void workerLoop();
        void rebuildSession();
        TranslateOutcome run(const std::string& text, const Language& from, const Language& to, bool include_extras,
                             std::atomic<bool>* cancel_flag);
        TranslateOutcome fail(TranslateError error, std::string message, const std::string& text, const Language& from,
                              const Language& to);

        std::unique_ptr<IHttpClient> owned_http_;
        IHttpClient& http_;

        TranslatorConfig cfg_{};
        LanguageCatalog catalog_;
        std::unique_ptr<SessionCookie> cookie_;
        std::unique_ptr<TokenGenerator> tokens_;

        std::atomic<bool> running_{false};
        std::thread worker_;
        std::mutex q_mtx_;
        std::queue<Job> queue_;
        std::mutex r_mtx_;
        std::vector<Completed> results_;
        std::uint64_t next_id_ = 1;
        std::string last_error_;
    };
}
