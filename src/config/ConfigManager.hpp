#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    // Applies one section; returns false and fills error when a value is unusable
    std::function<bool(const toml::table& section, std::string& error)> load;
};

// Owns the parsed config.toml and dispatches its sections to registered handlers.
// A missing file is not an error: every handler then sees an empty table.
// The file is read before any logger exists, so problems are queued on utils::ErrorReporter.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);
    bool load();
    const toml::table& root() const;

    const std::string& configPath() const { return config_path_; }
    bool fileExists() const;
    const char* lastError() const { return last_error_.c_str(); }

private:
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;
    void warnUnknownKeys(const toml::table& section, const std::string& path,
                         const std::vector<std::string>& ownedKeys) const;

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
