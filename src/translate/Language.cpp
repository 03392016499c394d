#include "Language.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace translate
{

namespace
{

constexpr const char* kBundledLanguages = R"json([
    {"fullName": "Afrikaans", "iso639": "af"},
    {"fullName": "Albanian", "iso639": "sq"},
    {"fullName": "Amharic", "iso639": "am"},
    {"fullName": "Arabic", "iso639": "ar"},
    {"fullName": "Armenian", "iso639": "hy"},
    {"fullName": "Azerbaijani", "iso639": "az"},
    {"fullName": "Basque", "iso639": "eu"},
    {"fullName": "Belarusian", "iso639": "be"},
    {"fullName": "Bengali", "iso639": "bn"},
    {"fullName": "Bosnian", "iso639": "bs"},
    {"fullName": "Bulgarian", "iso639": "bg"},
    {"fullName": "Catalan", "iso639": "ca"},
    {"fullName": "Cebuano", "iso639": "ceb"},
    {"fullName": "Chichewa", "iso639": "ny"},
    {"fullName": "Chinese Simplified", "iso639": "zh-CN"},
    {"fullName": "Chinese Traditional", "iso639": "zh-TW"},
    {"fullName": "Corsican", "iso639": "co"},
    {"fullName": "Croatian", "iso639": "hr"},
    {"fullName": "Czech", "iso639": "cs"},
    {"fullName": "Danish", "iso639": "da"},
    {"fullName": "Dutch", "iso639": "nl"},
    {"fullName": "English", "iso639": "en"},
    {"fullName": "Esperanto", "iso639": "eo"},
    {"fullName": "Estonian", "iso639": "et"},
    {"fullName": "Filipino", "iso639": "tl"},
    {"fullName": "Finnish", "iso639": "fi"},
    {"fullName": "French", "iso639": "fr"},
    {"fullName": "Frisian", "iso639": "fy"},
    {"fullName": "Galician", "iso639": "gl"},
    {"fullName": "Georgian", "iso639": "ka"},
    {"fullName": "German", "iso639": "de"},
    {"fullName": "Greek", "iso639": "el"},
    {"fullName": "Gujarati", "iso639": "gu"},
    {"fullName": "Haitian Creole", "iso639": "ht"},
    {"fullName": "Hausa", "iso639": "ha"},
    {"fullName": "Hawaiian", "iso639": "haw"},
    {"fullName": "Hebrew", "iso639": "iw"},
    {"fullName": "Hindi", "iso639": "hi"},
    {"fullName": "Hmong", "iso639": "hmn"},
    {"fullName": "Hungarian", "iso639": "hu"},
    {"fullName": "Icelandic", "iso639": "is"},
    {"fullName": "Igbo", "iso639": "ig"},
    {"fullName": "Indonesian", "iso639": "id"},
    {"fullName": "Irish", "iso639": "ga"},
    {"fullName": "Italian", "iso639": "it"},
    {"fullName": "Japanese", "iso639": "ja"},
    {"fullName": "Javanese", "iso639": "jw"},
    {"fullName": "Kannada", "iso639": "kn"},
    {"fullName": "Kazakh", "iso639": "kk"},
    {"fullName": "Khmer", "iso639": "km"},
    {"fullName": "Kinyarwanda", "iso639": "rw"},
    {"fullName": "Korean", "iso639": "ko"},
    {"fullName": "Kurdish (Kurmanji)", "iso639": "ku"},
    {"fullName": "Kyrgyz", "iso639": "ky"},
    {"fullName": "Lao", "iso639": "lo"},
    {"fullName": "Latin", "iso639": "la"},
    {"fullName": "Latvian", "iso639": "lv"},
    {"fullName": "Lithuanian", "iso639": "lt"},
    {"fullName": "Luxembourgish", "iso639": "lb"},
    {"fullName": "Macedonian", "iso639": "mk"},
    {"fullName": "Malagasy", "iso639": "mg"},
    {"fullName": "Malay", "iso639": "ms"},
    {"fullName": "Malayalam", "iso639": "ml"},
    {"fullName": "Maltese", "iso639": "mt"},
    {"fullName": "Maori", "iso639": "mi"},
    {"fullName": "Marathi", "iso639": "mr"},
    {"fullName": "Mongolian", "iso639": "mn"},
    {"fullName": "Myanmar (Burmese)", "iso639": "my"},
    {"fullName": "Nepali", "iso639": "ne"},
    {"fullName": "Norwegian", "iso639": "no"},
    {"fullName": "Odia (Oriya)", "iso639": "or"},
    {"fullName": "Pashto", "iso639": "ps"},
    {"fullName": "Persian", "iso639": "fa"},
    {"fullName": "Polish", "iso639": "pl"},
    {"fullName": "Portuguese", "iso639": "pt"},
    {"fullName": "Punjabi", "iso639": "pa"},
    {"fullName": "Romanian", "iso639": "ro"},
    {"fullName": "Russian", "iso639": "ru"},
    {"fullName": "Samoan", "iso639": "sm"},
    {"fullName": "Scots Gaelic", "iso639": "gd"},
    {"fullName": "Serbian", "iso639": "sr"},
    {"fullName": "Sesotho", "iso639": "st"},
    {"fullName": "Shona", "iso639": "sn"},
    {"fullName": "Sindhi", "iso639": "sd"},
    {"fullName": "Sinhala", "iso639": "si"},
    {"fullName": "Slovak", "iso639": "sk"},
    {"fullName": "Slovenian", "iso639": "sl"},
    {"fullName": "Somali", "iso639": "so"},
    {"fullName": "Spanish", "iso639": "es"},
    {"fullName": "Sundanese", "iso639": "su"},
    {"fullName": "Swahili", "iso639": "sw"},
    {"fullName": "Swedish", "iso639": "sv"},
    {"fullName": "Tajik", "iso639": "tg"},
    {"fullName": "Tamil", "iso639": "ta"},
    {"fullName": "Tatar", "iso639": "tt"},
    {"fullName": "Telugu", "iso639": "te"},
    {"fullName": "Thai", "iso639": "th"},
    {"fullName": "Turkish", "iso639": "tr"},
    {"fullName": "Turkmen", "iso639": "tk"},
    {"fullName": "Ukrainian", "iso639": "uk"},
    {"fullName": "Urdu", "iso639": "ur"},
    {"fullName": "Uyghur", "iso639": "ug"},
    {"fullName": "Uzbek", "iso639": "uz"},
    {"fullName": "Vietnamese", "iso639": "vi"},
    {"fullName": "Welsh", "iso639": "cy"},
    {"fullName": "Xhosa", "iso639": "xh"},
    {"fullName": "Yiddish", "iso639": "yi"},
    {"fullName": "Yoruba", "iso639": "yo"},
    {"fullName": "Zulu", "iso639": "zu"}
])json";

bool iequals(const std::string& a, const std::string& b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y)
                      {
                          return std::tolower(static_cast<unsigned char>(x)) ==
                                 std::tolower(static_cast<unsigned char>(y));
                      });
}

} // namespace

bool Language::isAuto() const { return iequals(iso639, "auto"); }

bool Language::operator==(const Language& other) const { return iequals(iso639, other.iso639); }

bool LanguageCatalog::loadFromJson(const std::string& json_text)
{
    last_error_.clear();
    try
    {
        json doc = json::parse(json_text);
        if (!doc.is_array())
        {
            last_error_ = "language catalog is not a JSON array";
            PLOG_ERROR << last_error_;
            return false;
        }

        std::vector<Language> parsed;
        parsed.reserve(doc.size());
        for (const auto& record : doc)
        {
            if (!record.is_object())
            {
                PLOG_WARNING << "Skipping non-object language record";
                continue;
            }
            auto name = record.find("fullName");
            auto code = record.find("iso639");
            if (name == record.end() || code == record.end() || !name->is_string() || !code->is_string() ||
                name->get_ref<const std::string&>().empty() || code->get_ref<const std::string&>().empty())
            {
                PLOG_WARNING << "Skipping incomplete language record: " << record.dump();
                continue;
            }
            parsed.push_back(Language{ name->get<std::string>(), code->get<std::string>() });
        }

        languages_ = std::move(parsed);
        PLOG_DEBUG << "Language catalog loaded with " << languages_.size() << " entries";
        return true;
    }
    catch (const json::exception& e)
    {
        last_error_ = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << last_error_;
        return false;
    }
}

bool LanguageCatalog::loadFile(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        last_error_ = "cannot open language file: " + path;
        PLOG_ERROR << last_error_;
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return loadFromJson(ss.str());
}

const LanguageCatalog& LanguageCatalog::bundled()
{
    static const LanguageCatalog catalog = []
    {
        LanguageCatalog c;
        if (!c.loadFromJson(kBundledLanguages))
            PLOG_FATAL << "Bundled language catalog is corrupt: " << c.lastError();
        return c;
    }();
    return catalog;
}

std::optional<Language> LanguageCatalog::findByIso(const std::string& iso) const
{
    auto it = std::find_if(languages_.begin(), languages_.end(),
                           [&](const Language& l) { return iequals(l.iso639, iso); });
    if (it == languages_.end())
        return std::nullopt;
    return *it;
}

std::optional<Language> LanguageCatalog::findByName(const std::string& name) const
{
    auto it = std::find_if(languages_.begin(), languages_.end(),
                           [&](const Language& l) { return iequals(l.full_name, name); });
    if (it == languages_.end())
        return std::nullopt;
    return *it;
}

bool LanguageCatalog::isSupported(const Language& language) const
{
    if (language.isAuto())
        return true;
    return findByIso(language.iso639).has_value();
}

} // namespace translate
