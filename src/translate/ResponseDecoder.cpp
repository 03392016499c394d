#include "ResponseDecoder.hpp"
#include "../utils/Diagnostics.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <optional>
#include <regex>

using json = nlohmann::json;

namespace translate
{

namespace
{

class AnomalySink
{
public:
    explicit AnomalySink(std::vector<std::string>& out)
        : out_(out)
    {
    }

    void report(ResponseSlot slot, const std::string& what)
    {
        std::string msg = std::string(toString(slot)) + ": " + what;
        PLOG_DEBUG << "Decode anomaly in " << msg;
        out_.push_back(std::move(msg));
    }

private:
    std::vector<std::string>& out_;
};

// nullptr when the slot is past the end of the response or holds null
const json* slot(const json& root, ResponseSlot s)
{
    const auto index = static_cast<std::size_t>(s);
    if (index >= root.size())
        return nullptr;
    const json& node = root[index];
    return node.is_null() ? nullptr : &node;
}

bool hasSlot(const json& root, ResponseSlot s) { return static_cast<std::size_t>(s) < root.size(); }

std::optional<std::string> stringAt(const json& arr, std::size_t index)
{
    if (!arr.is_array() || index >= arr.size() || !arr[index].is_string())
        return std::nullopt;
    return arr[index].get<std::string>();
}

std::vector<std::string> stringList(const json& arr)
{
    std::vector<std::string> out;
    if (!arr.is_array())
        return out;
    for (const auto& v : arr)
    {
        if (v.is_string())
            out.push_back(v.get<std::string>());
    }
    return out;
}

// A trailing tuple with no translated fragment in front carries transliterations
bool isTranscriptionTuple(const json& tuple) { return tuple.is_array() && (tuple.empty() || !tuple[0].is_string()); }

void decodeMainTranslation(const json& root, TranslationResult& result, AnomalySink& sink)
{
    const json* block = slot(root, ResponseSlot::MainTranslation);
    if (!block)
        return;
    if (!block->is_array())
    {
        sink.report(ResponseSlot::MainTranslation, "not an array");
        return;
    }

    std::size_t fragment_count = block->size();
    const bool has_transcription = block->size() > 1 && isTranscriptionTuple(block->back());
    if (has_transcription)
        --fragment_count;

    for (std::size_t i = 0; i < fragment_count; ++i)
    {
        if (auto fragment = stringAt((*block)[i], 0))
            result.fragmented_translation.push_back(std::move(*fragment));
        else
            sink.report(ResponseSlot::MainTranslation, "fragment " + std::to_string(i) + " has no text");
    }

    if (!has_transcription)
        return;

    const json& info = block->back();
    const std::size_t n = info.size();
    if (n == 3)
    {
        result.translated_text_transcription = stringAt(info, 2);
    }
    else if (n >= 2)
    {
        if (!info[n - 2].is_null())
        {
            result.translated_text_transcription = stringAt(info, n - 2);
            result.original_text_transcription = stringAt(info, n - 1);
        }
        else
        {
            result.translated_text_transcription = stringAt(info, n - 1);
        }
    }
}

Corrections decodeCorrections(const json& root, const LanguageCatalog& catalog, AnomalySink& sink)
{
    Corrections corrections;

    if (const json* spelling = slot(root, ResponseSlot::SpellingCorrection))
    {
        if (!spelling->is_array())
        {
            sink.report(ResponseSlot::SpellingCorrection, "not an array");
        }
        else if (!spelling->empty())
        {
            static const std::regex kCorrectedWord("<b><i>(.*?)</i></b>");
            const std::string html = stringAt(*spelling, 0).value_or("");
            for (std::sregex_iterator it(html.begin(), html.end(), kCorrectedWord), end; it != end; ++it)
                corrections.corrected_words.push_back((*it)[1].str());

            corrections.corrected_text = stringAt(*spelling, 1).value_or("");
            corrections.text_was_corrected = true;
        }
    }

    std::optional<std::string> selected;
    if (const json* node = slot(root, ResponseSlot::SelectedLanguage))
    {
        if (node->is_string())
            selected = node->get<std::string>();
        else
            sink.report(ResponseSlot::SelectedLanguage, "not a string");
    }

    std::optional<std::string> detected;
    if (const json* node = slot(root, ResponseSlot::DetectedLanguage))
    {
        if (node->is_array() && !node->empty())
            detected = stringAt((*node)[0], 0);
        if (!detected)
            sink.report(ResponseSlot::DetectedLanguage, "no detected language code");
    }

    if (selected && detected && *selected != *detected)
    {
        corrections.language_was_corrected = true;
        corrections.corrected_language = catalog.findByIso(*detected);
    }

    if (const json* node = slot(root, ResponseSlot::Confidence))
    {
        if (node->is_number())
            corrections.confidence = std::clamp(node->get<double>(), 0.0, 1.0);
        else
            sink.report(ResponseSlot::Confidence, "not a number");
    }

    return corrections;
}

// Each variant reads its entries from one position inside a
// [partOfSpeech, ...] item and knows how to turn that node into entries.
template <typename Traits>
struct InfoReader;

template <>
struct InfoReader<ExtraTranslationTraits>
{
    // [pos, [terms], [[word, [reverse...], ?, score], ...], base form, ...]
    static constexpr std::size_t kDataIndex = 2;

    static bool read(const json& node, std::vector<ExtraTranslation>& out)
    {
        if (!node.is_array())
            return false;
        for (const auto& item : node)
        {
            auto phrase = stringAt(item, 0);
            if (!phrase)
                return false;
            ExtraTranslation entry;
            entry.phrase = std::move(*phrase);
            if (item.size() > 1)
                entry.reverse_translations = stringList(item[1]);
            if (item.size() > 3 && item[3].is_number())
                entry.frequency = item[3].get<double>();
            out.push_back(std::move(entry));
        }
        return true;
    }
};

template <>
struct InfoReader<SynonymTraits>
{
    // [pos, [[[word, ...], id], ...], base form]
    static constexpr std::size_t kDataIndex = 1;

    static bool read(const json& node, std::vector<SynonymGroup>& out)
    {
        if (!node.is_array())
            return false;
        for (const auto& item : node)
        {
            if (!item.is_array() || item.empty() || !item[0].is_array())
                return false;
            out.push_back(SynonymGroup{ stringList(item[0]) });
        }
        return true;
    }
};

template <>
struct InfoReader<DefinitionTraits>
{
    // [pos, [[explanation, id, example], ...], base form, ...]
    static constexpr std::size_t kDataIndex = 1;

    static bool read(const json& node, std::vector<Definition>& out)
    {
        if (!node.is_array())
            return false;
        for (const auto& item : node)
        {
            auto explanation = stringAt(item, 0);
            if (!explanation)
                return false;
            out.push_back(Definition{ std::move(*explanation), stringAt(item, 2) });
        }
        return true;
    }
};

template <typename Traits>
std::optional<PartOfSpeechCollection<Traits>> decodeInfo(const json& root, ResponseSlot s, AnomalySink& sink)
{
    using Reader = InfoReader<Traits>;

    const json* block = slot(root, s);
    if (!block)
        return std::nullopt;
    if (!block->is_array())
    {
        sink.report(s, "not an array");
        return std::nullopt;
    }
    if (block->empty())
        return std::nullopt;

    PartOfSpeechCollection<Traits> collection;
    for (const auto& item : *block)
    {
        auto tag = stringAt(item, 0);
        if (!tag)
        {
            sink.report(s, "entry without part of speech");
            continue;
        }
        if (item.size() <= Reader::kDataIndex)
        {
            sink.report(s, "entry '" + *tag + "' is truncated");
            continue;
        }

        std::vector<typename Traits::Entry> entries;
        if (!Reader::read(item[Reader::kDataIndex], entries))
        {
            sink.report(s, "entry '" + *tag + "' has an unexpected shape");
            continue;
        }

        // Unnamed members show up now and then; nothing to report for those
        if (!collection.add(*tag, std::move(entries)) &&
            !PartOfSpeechCollection<Traits>::normalizeTag(*tag).empty())
        {
            PLOG_DEBUG << toString(s) << " has no member for part of speech '" << *tag << "'";
        }
    }
    return collection;
}

std::vector<std::string> decodeSeeAlso(const json& root, AnomalySink& sink)
{
    const json* block = slot(root, ResponseSlot::SeeAlso);
    if (!block)
        return {};
    if (!block->is_array())
    {
        sink.report(ResponseSlot::SeeAlso, "not an array");
        return {};
    }
    if (block->empty())
        return {};
    return stringList((*block)[0]);
}

} // namespace

const char* toString(ResponseSlot slot)
{
    switch (slot)
    {
    case ResponseSlot::MainTranslation:
        return "main translation";
    case ResponseSlot::ExtraTranslations:
        return "extra translations";
    case ResponseSlot::SelectedLanguage:
        return "selected language";
    case ResponseSlot::Confidence:
        return "confidence";
    case ResponseSlot::SpellingCorrection:
        return "spelling correction";
    case ResponseSlot::DetectedLanguage:
        return "detected language";
    case ResponseSlot::Synonyms:
        return "synonyms";
    case ResponseSlot::Definitions:
        return "definitions";
    case ResponseSlot::SeeAlso:
        return "see also";
    }
    return "unknown";
}

ResponseDecoder::ResponseDecoder(const LanguageCatalog& catalog)
    : catalog_(catalog)
{
}

bool ResponseDecoder::decode(const std::string& raw_json, const std::string& original_text, const Language& source,
                             const Language& target, bool include_extras, TranslationResult& out)
{
    anomalies_.clear();
    last_error_.clear();

    json root;
    try
    {
        root = json::parse(raw_json);
    }
    catch (const json::parse_error& e)
    {
        last_error_ = std::string("JSON parse error: ") + e.what();
        PLOG_WARNING << last_error_;
        PLOG_DEBUG << "Body: " << utils::Diagnostics::Preview(raw_json);
        return false;
    }
    if (!root.is_array())
    {
        last_error_ = "response is not a JSON array";
        PLOG_WARNING << last_error_ << ": " << utils::Diagnostics::Preview(raw_json);
        return false;
    }

    AnomalySink sink(anomalies_);
    TranslationResult result;
    result.original_text = original_text;
    result.target_language = target;
    result.source_language = source;

    decodeMainTranslation(root, result, sink);
    result.corrections = decodeCorrections(root, catalog_, sink);

    if (source.isAuto())
    {
        std::optional<Language> detected;
        if (const json* node = slot(root, ResponseSlot::DetectedLanguage); node && node->is_array() && !node->empty())
        {
            if (auto code = stringAt((*node)[0], 0))
                detected = catalog_.findByIso(*code);
        }
        if (detected)
            result.source_language = *detected;
        else
            sink.report(ResponseSlot::DetectedLanguage, "cannot resolve the detected source language");
    }

    if (include_extras)
    {
        result.extra_translations = decodeInfo<ExtraTranslationTraits>(root, ResponseSlot::ExtraTranslations, sink);
        if (hasSlot(root, ResponseSlot::Synonyms))
            result.synonyms = decodeInfo<SynonymTraits>(root, ResponseSlot::Synonyms, sink);
        if (hasSlot(root, ResponseSlot::Definitions))
            result.definitions = decodeInfo<DefinitionTraits>(root, ResponseSlot::Definitions, sink);
        if (hasSlot(root, ResponseSlot::SeeAlso))
            result.see_also = decodeSeeAlso(root, sink);
    }

    if (!anomalies_.empty())
        PLOG_WARNING << "Decoded response with " << anomalies_.size() << " skipped block(s) or entries";

    out = std::move(result);
    return true;
}

} // namespace translate
