#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ArchiverConfig;

struct CommandLineOptions
{
    bool all = false;
    bool by_year = false;
    bool verbose = false;
    bool help = false;
    bool version = false;
    std::optional<std::int64_t> max_words;
    std::optional<std::int64_t> max_bytes;
    std::optional<std::string> data_dir;
    std::optional<std::string> output_dir;
    std::optional<std::string> report_path;
    std::string config_path = "config.toml";
    std::vector<std::string> prefixes;  // upper-cased, sorted, unique
};

// Parses argv[1..]; returns nullopt and fills error on unknown flags or bad values.
// Accepts "--flag value" and "--flag=value".
std::optional<CommandLineOptions> parse_command_line(int argc, const char* const* argv, std::string& error);

std::string usage_text(const std::string& program);

// Flags given on the command line win over config.toml
void apply_overrides(const CommandLineOptions& options, ArchiverConfig& config);

// Defaults used when neither prefixes nor --all are given
const std::vector<std::string>& default_prefixes();
