#pragma once

#include "Language.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace translate
{

struct ExtraTranslation
{
    std::string phrase;
    std::vector<std::string> reverse_translations;
    std::optional<double> frequency;

    bool operator==(const ExtraTranslation&) const = default;
};

// Interchangeable words sharing one sense
struct SynonymGroup
{
    std::vector<std::string> words;

    bool operator==(const SynonymGroup&) const = default;
};

struct Definition
{
    std::string explanation;
    std::optional<std::string> example;

    bool operator==(const Definition&) const = default;
};

// Entries are stored under the normalized tag: lower case, whitespace removed,
// so "auxiliary verb" lands on "auxiliaryverb".
template <typename Traits>
class PartOfSpeechCollection
{
public:
    using Entry = typename Traits::Entry;
    using Map = std::map<std::string, std::vector<Entry>, std::less<>>;

    static std::string normalizeTag(std::string_view tag)
    {
        std::string out;
        out.reserve(tag.size());
        for (char c : tag)
        {
            unsigned char uc = static_cast<unsigned char>(c);
            if (std::isspace(uc))
                continue;
            out.push_back(static_cast<char>(std::tolower(uc)));
        }
        return out;
    }

    static bool recognizes(std::string_view normalized_tag)
    {
        return std::find(Traits::kTags.begin(), Traits::kTags.end(), normalized_tag) != Traits::kTags.end();
    }

    // Returns false and stores nothing when the tag is not part of this variant
    bool add(std::string_view tag, std::vector<Entry> items)
    {
        std::string key = normalizeTag(tag);
        if (!recognizes(key))
            return false;
        auto& slot = entries_[key];
        slot.insert(slot.end(), std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
        return true;
    }

    const std::vector<Entry>* find(std::string_view tag) const
    {
        auto it = entries_.find(normalizeTag(tag));
        return it == entries_.end() ? nullptr : &it->second;
    }

    const Map& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

    bool operator==(const PartOfSpeechCollection&) const = default;

private:
    Map entries_;
};

struct ExtraTranslationTraits
{
    using Entry = ExtraTranslation;
    static constexpr std::array<std::string_view, 15> kTags{
        "noun",         "verb",   "adjective", "adverb", "pronoun", "preposition", "conjunction",  "interjection",
        "abbreviation", "phrase", "prefix",    "suffix", "article", "particle",    "auxiliaryverb",
    };
};

struct SynonymTraits
{
    using Entry = SynonymGroup;
    static constexpr std::array<std::string_view, 11> kTags{
        "noun",        "verb",         "adjective",    "adverb", "pronoun",     "preposition",
        "conjunction", "interjection", "abbreviation", "phrase", "exclamation",
    };
};

struct DefinitionTraits
{
    using Entry = Definition;
    static constexpr std::array<std::string_view, 14> kTags{
        "noun",         "verb",   "adjective",   "adverb", "pronoun", "preposition",  "conjunction",
        "interjection", "abbreviation", "phrase", "exclamation", "prefix", "suffix", "auxiliaryverb",
    };
};

using ExtraTranslations = PartOfSpeechCollection<ExtraTranslationTraits>;
using Synonyms = PartOfSpeechCollection<SynonymTraits>;
using Definitions = PartOfSpeechCollection<DefinitionTraits>;

struct Corrections
{
    bool text_was_corrected = false;
    std::string corrected_text;
    std::vector<std::string> corrected_words;

    bool language_was_corrected = false;
    std::optional<Language> corrected_language;

    // [0, 1]
    double confidence = 0.0;

    bool operator==(const Corrections&) const = default;
};

struct TranslationResult
{
    std::string original_text;
    Language source_language;
    Language target_language;

    std::vector<std::string> fragmented_translation;
    std::optional<std::string> original_text_transcription;
    std::optional<std::string> translated_text_transcription;

    Corrections corrections;

    // Only filled by full (non-lite) requests
    std::optional<ExtraTranslations> extra_translations;
    std::optional<Synonyms> synonyms;
    std::optional<Definitions> definitions;
    std::optional<std::vector<std::string>> see_also;

    std::string mergedTranslation() const;
    // True when nothing was translated, whatever the request carried
    bool empty() const
    {
        return fragmented_translation.empty() && !original_text_transcription && !translated_text_transcription &&
               !extra_translations && !synonyms && !definitions && !see_also;
    }

    bool operator==(const TranslationResult&) const = default;
};

// Pretty JSON view of a result, used by the CLI and in diagnostics
std::string toJsonString(const TranslationResult& result, int indent = 2);

} // namespace translate
