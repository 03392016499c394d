#pragma once

#include "../utils/HttpCommon.hpp"
#include "ITranslator.hpp"
#include "Language.hpp"

#include <string>
#include <vector>

namespace translate {

struct RequestContext
{
    std::string domain = "translate.google.com";
    std::string user_agent;
    std::string cookie;
};

struct SingleRequest
{
    TranslateError error = TranslateError::None;
    std::string message;
    std::string url;
    std::vector<Header> headers;

    bool ok() const { return error == TranslateError::None; }
};

// Rejects languages missing from the catalog and an auto-detect target.
// Runs before any network activity.
TranslateError check_language_pair(const Language& from, const Language& to, const LanguageCatalog& catalog,
                                   std::string& message);

// GET https://{domain}/translate_a/single with every data block requested
SingleRequest build_translation_request(const std::string& text, const Language& from, const Language& to,
                                        const std::string& token, const RequestContext& ctx,
                                        const LanguageCatalog& catalog);

} // namespace translate
