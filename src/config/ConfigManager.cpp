#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <fstream>
#include <sstream>

ConfigManager::ConfigManager(std::string path)
    : config_path_(std::move(path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path == path)
        {
            for (const auto& key : ownedKeys)
            {
                for (const auto& existingKey : handler.ownedKeys)
                {
                    if (key == existingKey)
                    {
                        last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                        PLOG_ERROR << last_error_;
                        return false;
                    }
                }
            }
        }
    }
    
    handlers_.push_back({path, std::move(cb), std::move(ownedKeys)});
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        return true;
    }
    
    try
    {
        return apply(toml::parse(ifs, config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;
        
        std::string error_details = "TOML parse error";
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }
        
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            error_details + "\nFile: " + config_path_);
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& document)
{
    last_error_.clear();
    try
    {
        return apply(toml::parse(document));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;
        return false;
    }
}

bool ConfigManager::apply(toml::table parsed)
{
    root_ = std::make_unique<toml::table>(std::move(parsed));

    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(*root_, handler.path);
        if (section)
        {
            handler.callbacks.load(*section);
        }
        else
        {
            toml::table empty;
            handler.callbacks.load(empty);
        }
    }

    PLOG_DEBUG << "Config applied to " << handlers_.size() << " handler(s)";
    return true;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;
    
    std::istringstream ss(path);
    std::string segment;
    const toml::table* current = &root;
    
    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }
        
        auto it = current->find(segment);
        if (it == current->end())
            return nullptr;
        
        auto* tbl = it->second.as_table();
        if (!tbl)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
        
        current = tbl;
    }
    
    return current;
}
