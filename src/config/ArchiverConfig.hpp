#pragma once

#include "../archive/ChunkTypes.hpp"
#include "../processing/EpisodeParser.hpp"

#include <optional>
#include <string>

class ConfigManager;

struct PathsConfig
{
    std::string data_dir = "data";
    std::string output_dir;         // empty: write next to the transcripts

    [[nodiscard]] std::string resolvedOutputDir() const { return output_dir.empty() ? data_dir : output_dir; }
};

struct ProcessingConfig
{
    bool strip_disclaimer = true;
    bool strip_masthead = true;
    bool infer_date_from_body = true;
    bool verbose = false;
};

struct LoggingConfig
{
    int level = 4;                  // plog::Severity, 0 (none) .. 6 (verbose)
    bool append = true;
    std::string directory = "logs";
};

// Everything config.toml can set; command-line flags are applied on top
struct ArchiverConfig
{
    archive::ChunkingConfig chunking;
    PathsConfig paths;
    ProcessingConfig processing_options;
    LoggingConfig logging;

    [[nodiscard]] processing::ParserOptions parserOptions() const;

    // Reason the configuration is unusable, nullopt when it is fine
    [[nodiscard]] std::optional<std::string> validate() const;
};

// Registers [chunking], [paths], [processing] and [logging] handlers writing into config.
// config must outlive manager.load().
bool register_archiver_tables(ConfigManager& manager, ArchiverConfig& config);
