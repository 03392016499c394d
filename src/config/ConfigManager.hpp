#pragma once

#include <string>
#include <memory>
#include <functional>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

class ConfigManager
{
public:
    explicit ConfigManager(std::string path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // A missing file is not an error: every handler keeps its defaults.
    bool load();
    bool loadFromString(const std::string& document);
    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    bool apply(toml::table parsed);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
