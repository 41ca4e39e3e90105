#include "ArchiverConfig.hpp"
#include "ConfigManager.hpp"

#include <cstdint>

namespace
{

bool readBool(const toml::table& section, const char* key, bool& out, std::string& error)
{
    const toml::node* node = section.get(key);
    if (!node)
        return true;
    if (auto value = node->value_exact<bool>())
    {
        out = *value;
        return true;
    }
    error = std::string(key) + " must be a boolean";
    return false;
}

bool readInt(const toml::table& section, const char* key, std::int64_t& out, std::string& error)
{
    const toml::node* node = section.get(key);
    if (!node)
        return true;
    if (auto value = node->value_exact<std::int64_t>())
    {
        out = *value;
        return true;
    }
    error = std::string(key) + " must be an integer";
    return false;
}

bool readString(const toml::table& section, const char* key, std::string& out, std::string& error)
{
    const toml::node* node = section.get(key);
    if (!node)
        return true;
    if (auto value = node->value_exact<std::string>())
    {
        out = *value;
        return true;
    }
    error = std::string(key) + " must be a string";
    return false;
}

} // anonymous namespace

processing::ParserOptions ArchiverConfig::parserOptions() const
{
    processing::ParserOptions options;
    options.infer_date_from_body = processing_options.infer_date_from_body;
    options.pipeline.strip_masthead = processing_options.strip_masthead;
    options.pipeline.strip_disclaimer = processing_options.strip_disclaimer;
    return options;
}

std::optional<std::string> ArchiverConfig::validate() const
{
    if (auto reason = chunking.validate())
        return reason;
    if (paths.data_dir.empty())
        return std::string("data_dir must not be empty");
    if (logging.level < 0 || logging.level > 6)
        return "logging level must be between 0 and 6 (got " + std::to_string(logging.level) + ")";
    return std::nullopt;
}

bool register_archiver_tables(ConfigManager& manager, ArchiverConfig& config)
{
    bool ok = manager.registerTable(
        "chunking",
        { [&config](const toml::table& section, std::string& error)
          {
              return readInt(section, "max_words", config.chunking.max_words, error) &&
                     readInt(section, "max_bytes", config.chunking.max_bytes, error) &&
                     readBool(section, "by_year", config.chunking.by_year, error);
          } },
        { "max_words", "max_bytes", "by_year" });

    ok = manager.registerTable("paths",
                               { [&config](const toml::table& section, std::string& error)
                                 {
                                     return readString(section, "data_dir", config.paths.data_dir, error) &&
                                            readString(section, "output_dir", config.paths.output_dir, error);
                                 } },
                               { "data_dir", "output_dir" }) &&
         ok;

    ok = manager.registerTable(
             "processing",
             { [&config](const toml::table& section, std::string& error)
               {
                   auto& p = config.processing_options;
                   return readBool(section, "strip_disclaimer", p.strip_disclaimer, error) &&
                          readBool(section, "strip_masthead", p.strip_masthead, error) &&
                          readBool(section, "infer_date_from_body", p.infer_date_from_body, error) &&
                          readBool(section, "verbose", p.verbose, error);
               } },
             { "strip_disclaimer", "strip_masthead", "infer_date_from_body", "verbose" }) &&
         ok;

    ok = manager.registerTable("logging",
                               { [&config](const toml::table& section, std::string& error)
                                 {
                                     std::int64_t level = config.logging.level;
                                     if (!readInt(section, "level", level, error))
                                         return false;
                                     if (level < 0 || level > 6)
                                     {
                                         error = "level must be between 0 and 6";
                                         return false;
                                     }
                                     config.logging.level = static_cast<int>(level);
                                     return readBool(section, "append", config.logging.append, error) &&
                                            readString(section, "directory", config.logging.directory, error);
                                 } },
                               { "level", "append", "directory" }) &&
         ok;

    return ok;
}
