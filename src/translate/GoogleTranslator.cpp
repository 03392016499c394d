#include "GoogleTranslator.hpp"

#include <plog/Log.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iterator>
#include "ResponseDecoder.hpp"
#include "TranslationRequestBuilder.hpp"
#include "TranslatorHelpers.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

namespace translate
{

const char* toString(TranslateError error)
{
    switch (error)
    {
    case TranslateError::None:
        return "none";
    case TranslateError::UnsupportedLanguage:
        return "unsupported language";
    case TranslateError::InvalidTarget:
        return "invalid target language";
    case TranslateError::IpBanned:
        return "ip banned";
    case TranslateError::TransportError:
        return "transport error";
    case TranslateError::ParseError:
        return "parse error";
    case TranslateError::NotReady:
        return "not ready";
    }
    return "unknown";
}

} // namespace translate

namespace
{
bool isBlank(const std::string& text)
{
    return std::all_of(text.begin(), text.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}
} // namespace

using namespace translate;

GoogleTranslator::GoogleTranslator()
    : owned_http_(std::make_unique<CprHttpClient>())
    , http_(*owned_http_)
    , catalog_(LanguageCatalog::bundled())
{
    rebuildSession();
}

GoogleTranslator::GoogleTranslator(IHttpClient& http)
    : http_(http)
    , catalog_(LanguageCatalog::bundled())
{
    rebuildSession();
}

GoogleTranslator::~GoogleTranslator() { shutdown(); }

void GoogleTranslator::rebuildSession()
{
    SessionConfig scfg;
    scfg.connect_timeout_ms = cfg_.connect_timeout_ms;
    scfg.timeout_ms = cfg_.timeout_ms;
    scfg.proxy = cfg_.proxy;

    cookie_ = std::make_unique<SessionCookie>(http_, SessionCookie::Options{ .handshake_url = cfg_.handshake_url,
                                                                             .host = cfg_.domain,
                                                                             .user_agent = cfg_.user_agent,
                                                                             .session = scfg });
    tokens_ = std::make_unique<TokenGenerator>(
        http_, TokenGenerator::Options{ .seed_url = cfg_.seed_url, .user_agent = cfg_.user_agent, .session = scfg });
}

bool GoogleTranslator::configure(const TranslatorConfig& cfg)
{
    cfg_ = cfg;
    last_error_.clear();

    if (cfg_.languages_file.empty())
    {
        catalog_ = LanguageCatalog::bundled();
    }
    else
    {
        LanguageCatalog custom;
        if (!custom.loadFile(cfg_.languages_file))
        {
            last_error_ = std::string("Failed to load language catalog: ") + custom.lastError();
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization,
                                              "Could not load the language list", last_error_);
            return false;
        }
        catalog_ = std::move(custom);
        PLOG_INFO << "Using language catalog " << cfg_.languages_file << " (" << catalog_.size() << " languages)";
    }

    rebuildSession();
    return true;
}

Language GoogleTranslator::resolve(const std::string& iso) const
{
    if (Language{ iso, iso }.isAuto())
        return Language::Auto();
    if (auto lang = catalog_.findByIso(iso))
        return *lang;
    return Language{ iso, iso };
}

TranslateOutcome GoogleTranslator::translate(const std::string& text, const Language& from, const Language& to)
{
    return run(text, from, to, true, nullptr);
}

TranslateOutcome GoogleTranslator::translateLite(const std::string& text, const Language& from, const Language& to)
{
    return run(text, from, to, false, nullptr);
}

TranslateOutcome GoogleTranslator::translate(const std::string& text, const std::string& from_iso,
                                             const std::string& to_iso)
{
    return run(text, resolve(from_iso), resolve(to_iso), true, nullptr);
}

TranslateOutcome GoogleTranslator::translateLite(const std::string& text, const std::string& from_iso,
                                                 const std::string& to_iso)
{
    return run(text, resolve(from_iso), resolve(to_iso), false, nullptr);
}

TranslateOutcome GoogleTranslator::fail(TranslateError error, std::string message, const std::string& text,
                                        const Language& from, const Language& to)
{
    TranslateOutcome out;
    out.error = error;
    out.message = std::move(message);
    out.result.original_text = text;
    out.result.source_language = from;
    out.result.target_language = to;
    return out;
}

TranslateOutcome GoogleTranslator::run(const std::string& text, const Language& from, const Language& to,
                                       bool include_extras, std::atomic<bool>* cancel_flag)
{
    using namespace translate::helpers;

    std::string message;
    TranslateError pair_error = check_language_pair(from, to, catalog_, message);
    if (pair_error != TranslateError::None)
    {
        PLOG_WARNING << "Rejected translation request: " << message;
        return fail(pair_error, std::move(message), text, from, to);
    }

    // Requests carry the catalog's spelling of each code
    const Language source = from.isAuto() ? Language::Auto() : catalog_.findByIso(from.iso639).value_or(from);
    const Language target = catalog_.findByIso(to.iso639).value_or(to);

    if (isBlank(text))
    {
        TranslateOutcome out;
        out.result.original_text = text;
        out.result.source_language = source;
        out.result.target_language = target;
        return out;
    }

    SessionConfig scfg;
    scfg.connect_timeout_ms = cfg_.connect_timeout_ms;
    scfg.timeout_ms = cfg_.timeout_ms;
    scfg.proxy = cfg_.proxy;
    scfg.cancel_flag = cancel_flag;

    for (int attempt = 0;; ++attempt)
    {
        cookie_->ensureCookie();
        std::string token = tokens_->generate(text);

        RequestContext ctx{ .domain = cfg_.domain, .user_agent = cfg_.user_agent, .cookie = cookie_->headerValue() };
        SingleRequest req = build_translation_request(text, source, target, token, ctx, catalog_);
        if (!req.ok())
            return fail(req.error, req.message, text, source, target);

        if (int delay = courtesy_delay_ms(cfg_.courtesy_delay_min_ms, cfg_.courtesy_delay_max_ms); delay > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));

        PLOG_DEBUG << "Translation request [" << source.iso639 << " -> " << target.iso639 << "] "
                   << text.size() << " bytes, attempt " << (attempt + 1);

        HttpResponse r = http_.get(req.url, req.headers, scfg);
        cookie_->update(r.set_cookie);

        if (cancel_flag && !cancel_flag->load())
        {
            PLOG_DEBUG << "Translation request abandoned during shutdown";
            return fail(TranslateError::TransportError, "cancelled", text, source, target);
        }

        switch (classify_failure(r, tokens_->isSeedObsolete(), attempt))
        {
        case FailureAction::None:
            break;
        case FailureAction::RetryWithFreshToken:
            PLOG_INFO << "Request failed with a stale signing seed, retrying with a fresh token";
            continue;
        case FailureAction::IpBanned:
        {
            std::string err = describe_failure(r, utils::Diagnostics::Preview(r.text));
            PLOG_WARNING << "Translation service rejected the request: " << err;
            utils::ErrorReporter::ReportTranslationFailure(TranslateError::IpBanned, source.iso639, target.iso639,
                                                           err);
            return fail(TranslateError::IpBanned, std::move(err), text, source, target);
        }
        case FailureAction::Propagate:
        {
            std::string err = describe_failure(r, r.error);
            PLOG_WARNING << "Translation request failed: " << err;
            utils::ErrorReporter::ReportTranslationFailure(TranslateError::TransportError, source.iso639, target.iso639,
                                                           err);
            return fail(TranslateError::TransportError, std::move(err), text, source, target);
        }
        }

        ResponseDecoder decoder(catalog_);
        TranslateOutcome out;
        if (!decoder.decode(r.text, text, source, target, include_extras, out.result))
        {
            std::string err = decoder.lastError();
            utils::ErrorReporter::ReportTranslationFailure(TranslateError::ParseError, source.iso639, target.iso639,
                                                           err);
            return fail(TranslateError::ParseError, std::move(err), text, source, target);
        }

        PLOG_INFO << "Translation [" << out.result.source_language.iso639 << " -> " << target.iso639 << "]: '"
                  << utils::Diagnostics::Preview(text) << "' -> '"
                  << utils::Diagnostics::Preview(out.result.mergedTranslation()) << "'";
        return out;
    }
}

bool GoogleTranslator::init(const TranslatorConfig& cfg)
{
    shutdown();
    if (!configure(cfg))
        return false;
    running_.store(true);
    worker_ = std::thread(&GoogleTranslator::workerLoop, this);
    return true;
}

bool GoogleTranslator::isReady() const { return running_.load(); }

void GoogleTranslator::shutdown()
{
    running_.store(false);
    if (worker_.joinable())
        worker_.join();
    {
        std::lock_guard<std::mutex> lk(q_mtx_);
        std::queue<Job> empty;
        std::swap(queue_, empty);
    }
    {
        std::lock_guard<std::mutex> lk(r_mtx_);
        results_.clear();
    }
}

bool GoogleTranslator::submit(const std::string& text, const std::string& src_lang, const std::string& dst_lang,
                              bool lite, std::uint64_t& out_id)
{
    if (!isReady())
    {
        last_error_ = toString(TranslateError::NotReady);
        return false;
    }
    Job j;
    j.text = text;
    j.src = src_lang;
    j.dst = dst_lang;
    j.lite = lite;
    {
        std::lock_guard<std::mutex> lk(q_mtx_);
        j.id = next_id_++;
        out_id = j.id;
        queue_.push(std::move(j));
    }
    return true;
}

bool GoogleTranslator::drain(std::vector<Completed>& out)
{
    std::lock_guard<std::mutex> lk(r_mtx_);
    if (results_.empty())
        return false;
    out.insert(out.end(), std::make_move_iterator(results_.begin()), std::make_move_iterator(results_.end()));
    results_.clear();
    return true;
}

void GoogleTranslator::workerLoop()
{
    while (running_.load())
    {
        Job j;
        {
            std::lock_guard<std::mutex> lk(q_mtx_);
            if (!queue_.empty())
            {
                j = std::move(queue_.front());
                queue_.pop();
            }
        }
        if (j.id == 0)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        TranslateOutcome outcome = run(j.text, resolve(j.src), resolve(j.dst), !j.lite, &running_);

        Completed c;
        c.id = j.id;
        if (outcome.ok())
        {
            c.result = std::move(outcome.result);
        }
        else
        {
            PLOG_WARNING << "Translation job " << j.id << " failed [" << j.src << " -> " << j.dst
                         << "]: " << outcome.message;
            c.failed = true;
            c.error = outcome.error;
            c.original_text = j.text;
            c.error_message = std::move(outcome.message);
        }
        std::lock_guard<std::mutex> lk(r_mtx_);
        results_.push_back(std::move(c));
    }
}

std::string GoogleTranslator::testConnection()
{
    auto outcome = translateLite("Hello", Language{ "English", "en" }, resolve("de"));
    if (!outcome.ok())
        return std::string("Error: ") + toString(outcome.error) + " - " + outcome.message;
    if (outcome.result.mergedTranslation().empty())
        return "Error: translation service returned an empty result";
    return "Success: translation service connection test passed";
}
