#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "translate/ResponseDecoder.hpp"

using namespace translate;
using Catch::Matchers::WithinAbs;

namespace {

const Language kEnglish{"English", "en"};
const Language kGerman{"German", "de"};
const Language kFrench{"French", "fr"};

// "Hello world" en -> de with every block present
constexpr const char* kFullResponse = R"([
    [["Hallo Welt","Hello world",null,null,1],[null,null,"Hallo Velt","heh-LOH wurld"]],
    [["interjection",["Hallo!","Hallo"],[["Hallo!",["Hello!","Hi!"],null,0.39],["Hallo",["Hello"],null,0.1]],"Hello!",9]],
    "en",
    null,null,null,
    0.94,
    [],
    [["en"],null,[0.94],["en"]],
    null,null,
    [["exclamation",[[["hi","hey"],"m_en_us1254307.001"]],"hello"]],
    [["exclamation",[["used as a greeting.","m_en_us1254307.001","hello there, Katie!"]],"hello"]],
    null,
    [["hello there","hello world"]]
])";

TranslationResult decodeOrFail(ResponseDecoder& decoder, const std::string& body, const Language& from = kEnglish,
                               const Language& to = kGerman, bool extras = true) {
    TranslationResult result;
    REQUIRE(decoder.decode(body, "Hello world", from, to, extras, result));
    return result;
}

}  // namespace

TEST_CASE("Main translation block", "[translate][decoder]") {
    ResponseDecoder decoder(LanguageCatalog::bundled());

    SECTION("Fragments concatenate in order") {
        auto result = decodeOrFail(decoder, R"([[["Hello ","Hallo ",null,null,3],["world","Welt",null,null,3]],null,"de"])",
                                   kGerman, kEnglish);
        REQUIRE(result.fragmented_translation == std::vector<std::string>{"Hello ", "world"});
        REQUIRE(result.mergedTranslation() == "Hello world");
        REQUIRE_FALSE(result.translated_text_transcription.has_value());
        REQUIRE_FALSE(result.original_text_transcription.has_value());
    }

    SECTION("Trailing tuple with both transcriptions") {
        auto result = decodeOrFail(decoder, kFullResponse);
        REQUIRE(result.fragmented_translation == std::vector<std::string>{"Hallo Welt"});
        REQUIRE(result.translated_text_transcription == std::optional<std::string>("Hallo Velt"));
        REQUIRE(result.original_text_transcription == std::optional<std::string>("heh-LOH wurld"));
    }

    SECTION("Three element tuple carries only the translated transcription") {
        auto result = decodeOrFail(decoder, R"([[["Привет","Hello",null,null,1],[null,null,"Privet"]],null,"en"])");
        REQUIRE(result.mergedTranslation() == "Привет");
        REQUIRE(result.translated_text_transcription == std::optional<std::string>("Privet"));
        REQUIRE_FALSE(result.original_text_transcription.has_value());
    }

    SECTION("Null second-to-last element leaves only the translated transcription") {
        auto result = decodeOrFail(decoder, R"([[["Привет","Hello",null,null,1],[null,null,null,"Privet"]],null,"en"])");
        REQUIRE(result.translated_text_transcription == std::optional<std::string>("Privet"));
        REQUIRE_FALSE(result.original_text_transcription.has_value());
    }

    SECTION("Single fragment is never taken for a transcription") {
        auto result = decodeOrFail(decoder, R"([[["Hallo","Hello",null,null,3]],null,"en"])");
        REQUIRE(result.mergedTranslation() == "Hallo");
        REQUIRE_FALSE(result.translated_text_transcription.has_value());
    }

    SECTION("Result echoes the request") {
        auto result = decodeOrFail(decoder, kFullResponse);
        REQUIRE(result.original_text == "Hello world");
        REQUIRE(result.source_language == kEnglish);
        REQUIRE(result.target_language == kGerman);
    }
}

TEST_CASE("Corrections", "[translate][decoder]") {
    ResponseDecoder decoder(LanguageCatalog::bundled());

    SECTION("No corrections") {
        auto result = decodeOrFail(decoder, kFullResponse);
        REQUIRE_FALSE(result.corrections.text_was_corrected);
        REQUIRE_FALSE(result.corrections.language_was_corrected);
        REQUIRE_FALSE(result.corrections.corrected_language.has_value());
        REQUIRE_THAT(result.corrections.confidence, WithinAbs(0.94, 1e-9));
    }

    SECTION("Spelling correction lists the corrected words") {
        auto result = decodeOrFail(
            decoder,
            R"([[["Hallo Welt","helo wrld",null,null,1]],null,"en",null,null,null,0.5,)"
            R"(["<b><i>hello</i></b> <b><i>world</i></b>","hello world",null,null,null,true],[["en"],null,[0.5],["en"]]])");
        REQUIRE(result.corrections.text_was_corrected);
        REQUIRE(result.corrections.corrected_text == "hello world");
        REQUIRE(result.corrections.corrected_words == std::vector<std::string>{"hello", "world"});
    }

    SECTION("Detected language differs from the selected one") {
        auto result = decodeOrFail(decoder,
                                   R"([[["Hallo","Hello",null,null,1]],null,"fr",null,null,null,0.8,[],[["en"],null,[0.8],["en"]]])",
                                   kFrench, kGerman);
        REQUIRE(result.corrections.language_was_corrected);
        REQUIRE(result.corrections.corrected_language == std::optional<Language>(kEnglish));
        REQUIRE(result.corrections.corrected_language->full_name == "English");
    }

    SECTION("Confidence is clamped") {
        auto result = decodeOrFail(decoder, R"([[["Hallo","Hello",null,null,1]],null,"en",null,null,null,1.7])");
        REQUIRE_THAT(result.corrections.confidence, WithinAbs(1.0, 1e-9));
    }
}

TEST_CASE("Auto-detected source language", "[translate][decoder]") {
    ResponseDecoder decoder(LanguageCatalog::bundled());

    SECTION("Resolved from the detected code") {
        auto result = decodeOrFail(decoder, kFullResponse, Language::Auto(), kGerman);
        REQUIRE(result.source_language == kEnglish);
        REQUIRE(decoder.anomalies().empty());
    }

    SECTION("Unknown detected code keeps auto and is reported") {
        auto result = decodeOrFail(decoder, R"([[["Hallo","Hello",null,null,1]],null,"xx",null,null,null,0.5,[],[["xx"]]])",
                                   Language::Auto(), kGerman);
        REQUIRE(result.source_language.isAuto());
        REQUIRE_FALSE(decoder.anomalies().empty());
    }
}

TEST_CASE("Dictionary blocks", "[translate][decoder]") {
    ResponseDecoder decoder(LanguageCatalog::bundled());

    SECTION("Extra translations by part of speech") {
        auto result = decodeOrFail(decoder, kFullResponse);
        REQUIRE(result.extra_translations.has_value());
        const auto* entries = result.extra_translations->find("interjection");
        REQUIRE(entries != nullptr);
        REQUIRE(entries->size() == 2);
        REQUIRE((*entries)[0].phrase == "Hallo!");
        REQUIRE((*entries)[0].reverse_translations == std::vector<std::string>{"Hello!", "Hi!"});
        REQUIRE((*entries)[0].frequency.has_value());
        REQUIRE_THAT(*(*entries)[0].frequency, WithinAbs(0.39, 1e-9));
    }

    SECTION("Synonyms and definitions") {
        auto result = decodeOrFail(decoder, kFullResponse);
        REQUIRE(result.synonyms.has_value());
        const auto* groups = result.synonyms->find("exclamation");
        REQUIRE(groups != nullptr);
        REQUIRE(groups->size() == 1);
        REQUIRE((*groups)[0].words == std::vector<std::string>{"hi", "hey"});

        REQUIRE(result.definitions.has_value());
        const auto* defs = result.definitions->find("exclamation");
        REQUIRE(defs != nullptr);
        REQUIRE((*defs)[0].explanation == "used as a greeting.");
        REQUIRE((*defs)[0].example == std::optional<std::string>("hello there, Katie!"));
    }

    SECTION("See also") {
        auto result = decodeOrFail(decoder, kFullResponse);
        REQUIRE(result.see_also == std::optional<std::vector<std::string>>({"hello there", "hello world"}));
    }

    SECTION("Lite decode skips every dictionary block") {
        auto result = decodeOrFail(decoder, kFullResponse, kEnglish, kGerman, false);
        REQUIRE(result.mergedTranslation() == "Hallo Welt");
        REQUIRE_FALSE(result.extra_translations.has_value());
        REQUIRE_FALSE(result.synonyms.has_value());
        REQUIRE_FALSE(result.definitions.has_value());
        REQUIRE_FALSE(result.see_also.has_value());
    }

    SECTION("Absent blocks are empty, not errors") {
        auto result = decodeOrFail(decoder, R"([[["Hallo","Hello",null,null,3]],null,"en"])");
        REQUIRE_FALSE(result.extra_translations.has_value());
        REQUIRE_FALSE(result.synonyms.has_value());
        REQUIRE_FALSE(result.definitions.has_value());
        REQUIRE_FALSE(result.see_also.has_value());
        REQUIRE(decoder.anomalies().empty());
    }

    SECTION("Tags with inner whitespace are normalized") {
        auto result = decodeOrFail(decoder,
                                   R"([[["sein","be",null,null,1]],[["auxiliary verb",["sein"],[["sein",["be"],null,0.2]]]],"en"])");
        REQUIRE(result.extra_translations->find("auxiliary verb") != nullptr);
        REQUIRE(result.extra_translations->find("auxiliaryverb") != nullptr);
        REQUIRE(result.extra_translations->entries().count("auxiliaryverb") == 1);
    }

    SECTION("Unknown part of speech is ignored") {
        auto result = decodeOrFail(decoder,
                                   R"([[["x","y",null,null,1]],[["gibberish",["x"],[["x",["y"]]]]],"en"])");
        REQUIRE(result.extra_translations.has_value());
        REQUIRE(result.extra_translations->empty());
        REQUIRE(decoder.anomalies().empty());
    }

    SECTION("Malformed entry is skipped, the rest survives") {
        auto result = decodeOrFail(decoder,
                                   R"([[["gehen","go",null,null,1]],[["noun",[],"bad"],["verb",["gehen"],[["gehen",["go"],null,0.5]]]],"en"])");
        REQUIRE(result.extra_translations->find("noun") == nullptr);
        REQUIRE(result.extra_translations->find("verb") != nullptr);
        REQUIRE(decoder.anomalies().size() == 1);
        REQUIRE(result.mergedTranslation() == "gehen");
    }
}

TEST_CASE("Decoder failures and repeatability", "[translate][decoder]") {
    ResponseDecoder decoder(LanguageCatalog::bundled());
    TranslationResult result;

    SECTION("Invalid JSON") {
        REQUIRE_FALSE(decoder.decode("<html>unusual traffic</html>", "x", kEnglish, kGerman, true, result));
        REQUIRE(std::string(decoder.lastError()).find("JSON") != std::string::npos);
    }

    SECTION("Top level object") {
        REQUIRE_FALSE(decoder.decode(R"({"sentences":[]})", "x", kEnglish, kGerman, true, result));
    }

    SECTION("Malformed main block is an anomaly, not a failure") {
        REQUIRE(decoder.decode(R"(["oops",null,"en"])", "x", kEnglish, kGerman, true, result));
        REQUIRE(result.fragmented_translation.empty());
        REQUIRE(decoder.anomalies().size() == 1);
    }

    SECTION("Decoding twice gives the same result") {
        TranslationResult first;
        TranslationResult second;
        REQUIRE(decoder.decode(kFullResponse, "Hello world", kEnglish, kGerman, true, first));
        REQUIRE(decoder.decode(kFullResponse, "Hello world", kEnglish, kGerman, true, second));
        REQUIRE(first == second);
    }
}
