#include "TranslationResult.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace translate
{

namespace
{

json languageToJson(const Language& lang)
{
    return json{ { "fullName", lang.full_name }, { "iso639", lang.iso639 } };
}

template <typename T>
json optionalToJson(const std::optional<T>& value)
{
    return value ? json(*value) : json(nullptr);
}

template <typename Traits, typename Fn>
json collectionToJson(const std::optional<PartOfSpeechCollection<Traits>>& collection, Fn&& entryToJson)
{
    if (!collection)
        return nullptr;
    json out = json::object();
    for (const auto& [tag, entries] : collection->entries())
    {
        json list = json::array();
        for (const auto& entry : entries)
            list.push_back(entryToJson(entry));
        out[tag] = std::move(list);
    }
    return out;
}

} // namespace

std::string TranslationResult::mergedTranslation() const
{
    std::string merged;
    for (const auto& fragment : fragmented_translation)
        merged += fragment;
    return merged;
}

std::string toJsonString(const TranslationResult& result, int indent)
{
    json corrections{
        { "textWasCorrected", result.corrections.text_was_corrected },
        { "correctedText", result.corrections.corrected_text },
        { "correctedWords", result.corrections.corrected_words },
        { "languageWasCorrected", result.corrections.language_was_corrected },
        { "correctedLanguage",
          result.corrections.corrected_language ? languageToJson(*result.corrections.corrected_language)
                                                : json(nullptr) },
        { "confidence", result.corrections.confidence },
    };

    json out{
        { "originalText", result.original_text },
        { "mergedTranslation", result.mergedTranslation() },
        { "fragmentedTranslation", result.fragmented_translation },
        { "sourceLanguage", languageToJson(result.source_language) },
        { "targetLanguage", languageToJson(result.target_language) },
        { "originalTextTranscription", optionalToJson(result.original_text_transcription) },
        { "translatedTextTranscription", optionalToJson(result.translated_text_transcription) },
        { "corrections", std::move(corrections) },
    };

    out["extraTranslations"] = collectionToJson(result.extra_translations,
                                                [](const ExtraTranslation& e)
                                                {
                                                    return json{ { "phrase", e.phrase },
                                                                 { "reverseTranslations", e.reverse_translations },
                                                                 { "frequency", optionalToJson(e.frequency) } };
                                                });
    out["synonyms"] = collectionToJson(result.synonyms, [](const SynonymGroup& g) { return json(g.words); });
    out["definitions"] = collectionToJson(result.definitions,
                                          [](const Definition& d)
                                          {
                                              return json{ { "explanation", d.explanation },
                                                           { "example", optionalToJson(d.example) } };
                                          });
    out["seeAlso"] = optionalToJson(result.see_also);

    return out.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace translate
