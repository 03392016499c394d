#include "TranslationRequestBuilder.hpp"

#include <array>

namespace translate
{

namespace
{

// at: alternates, bd: dictionary, ex: examples, ld: detected language,
// md: definitions, qca: spelling, rw: see also, rm: transliteration,
// ss: synonyms, t: translation
constexpr std::array<const char*, 10> kDataTypes{ "at", "bd", "ex", "ld", "md", "qca", "rw", "rm", "ss", "t" };

} // namespace

TranslateError check_language_pair(const Language& from, const Language& to, const LanguageCatalog& catalog,
                                   std::string& message)
{
    if (!catalog.isSupported(from))
    {
        message = "Language '" + from.iso639 + "' is not supported";
        return TranslateError::UnsupportedLanguage;
    }
    if (!catalog.isSupported(to))
    {
        message = "Language '" + to.iso639 + "' is not supported";
        return TranslateError::UnsupportedLanguage;
    }
    if (to.isAuto())
    {
        message = "A destination language cannot be auto";
        return TranslateError::InvalidTarget;
    }
    message.clear();
    return TranslateError::None;
}

SingleRequest build_translation_request(const std::string& text, const Language& from, const Language& to,
                                        const std::string& token, const RequestContext& ctx,
                                        const LanguageCatalog& catalog)
{
    SingleRequest req;
    req.error = check_language_pair(from, to, catalog, req.message);
    if (!req.ok())
        return req;

    std::string url = "https://" + ctx.domain + "/translate_a/single";
    url += "?sl=" + url_escape(from.iso639);
    url += "&tl=" + url_escape(to.iso639);
    url += "&hl=en";
    url += "&q=" + url_escape(text);
    url += "&tk=" + url_escape(token);
    url += "&client=t";
    for (const char* dt : kDataTypes)
    {
        url += "&dt=";
        url += dt;
    }
    url += "&ie=UTF-8&oe=UTF-8&otf=1&ssel=0&tsel=0&kc=7";
    req.url = std::move(url);

    req.headers.push_back({ "User-Agent", ctx.user_agent });
    req.headers.push_back({ "Accept-Language", "en-US,en;q=0.5" });
    req.headers.push_back({ "Host", ctx.domain });
    req.headers.push_back({ "Cookie", ctx.cookie });
    req.headers.push_back({ "Content-Type", "text/plain" });
    return req;
}

} // namespace translate
