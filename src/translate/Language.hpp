#pragma once

#include <optional>
#include <string>
#include <vector>

namespace translate
{

// A language as the service knows it: display name plus the code sent in sl/tl
struct Language
{
    std::string full_name;
    std::string iso639;

    static Language Auto() { return Language{ "Automatic", "auto" }; }

    bool isAuto() const;

    // Codes compare case-insensitively, the way the catalog looks them up
    bool operator==(const Language& other) const;
    bool operator!=(const Language& other) const { return !(*this == other); }
};

class LanguageCatalog
{
public:
    LanguageCatalog() = default;

    // Parses a JSON array of {"fullName": ..., "iso639": ...} records.
    // Malformed records are skipped; a document that is not an array fails.
    bool loadFromJson(const std::string& json_text);
    bool loadFile(const std::string& path);

    // Catalog compiled into the library, parsed once on first use
    static const LanguageCatalog& bundled();

    std::optional<Language> findByIso(const std::string& iso) const;
    std::optional<Language> findByName(const std::string& name) const;

    // The auto-detect sentinel is always supported
    bool isSupported(const Language& language) const;

    const std::vector<Language>& languages() const { return languages_; }
    std::size_t size() const { return languages_.size(); }
    const char* lastError() const { return last_error_.c_str(); }

private:
    std::vector<Language> languages_;
    std::string last_error_;
};

} // namespace translate
