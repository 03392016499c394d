#pragma once

#include "Language.hpp"
#include "TranslationResult.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace translate
{

// Positions of the blocks inside the top-level response array. The format
// carries no field names; these are the only places that know the indices.
enum class ResponseSlot : std::size_t
{
    MainTranslation = 0,
    ExtraTranslations = 1,
    SelectedLanguage = 2,
    Confidence = 6,
    SpellingCorrection = 7,
    DetectedLanguage = 8,
    Synonyms = 11,
    Definitions = 12,
    SeeAlso = 14
};

const char* toString(ResponseSlot slot);

class ResponseDecoder
{
public:
    explicit ResponseDecoder(const LanguageCatalog& catalog);

    // Fails only when raw_json is not a JSON array. Each block is decoded
    // independently; a malformed block or entry is recorded in anomalies()
    // and left at its default.
    bool decode(const std::string& raw_json, const std::string& original_text, const Language& source,
                const Language& target, bool include_extras, TranslationResult& out);

    const std::vector<std::string>& anomalies() const { return anomalies_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    const LanguageCatalog& catalog_;
    std::vector<std::string> anomalies_;
    std::string last_error_;
};

} // namespace translate
