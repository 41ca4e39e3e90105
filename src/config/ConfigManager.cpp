#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::fileExists() const
{
    std::error_code ec;
    return fs::is_regular_file(config_path_, ec);
}

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
    root_ = std::make_unique<toml::table>();

    std::ifstream ifs(config_path_, std::ios::binary);
    if (ifs)
    {
        try
        {
            *root_ = toml::parse(ifs, config_path_);
        }
        catch (const toml::parse_error& pe)
        {
            std::string error_details = std::string(pe.description());
            if (pe.source().begin.line > 0)
                error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + error_details;

            last_error_ = "config parse error: " + error_details;
            utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration,
                                              "Configuration file could not be parsed",
                                              error_details + "\nFile: " + config_path_);
            return false;
        }
    }

    bool ok = true;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(*root_, handler.path);
        const toml::table empty;
        if (section)
            warnUnknownKeys(*section, handler.path, handler.ownedKeys);

        std::string error;
        if (!handler.callbacks.load(section ? *section : empty, error))
        {
            ok = false;
            last_error_ = "[" + handler.path + "] " + error;
            utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Invalid configuration value",
                                              last_error_ + "\nFile: " + config_path_);
        }
    }
    return ok;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

void ConfigManager::warnUnknownKeys(const toml::table& section, const std::string& path,
                                    const std::vector<std::string>& ownedKeys) const
{
    for (const auto& [key, value] : section)
    {
        if (value.is_table())
            continue;
        const std::string name(key.str());
        if (std::find(ownedKeys.begin(), ownedKeys.end(), name) == ownedKeys.end())
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Unknown key '" + name + "' in [" + path + "] ignored", config_path_);
    }
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
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Invalid path segment (empty) in path: " + path);
            return nullptr;
        }

        auto it = current->find(segment);
        if (it == current->end())
            return nullptr;

        auto* tbl = it->second.as_table();
        if (!tbl)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "[" + path + "] is not a table", config_path_);
            return nullptr;
        }

        current = tbl;
    }

    return current;
}
