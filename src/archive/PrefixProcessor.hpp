#pragma once

#include "ChunkTypes.hpp"
#include "IArtifactSink.hpp"
#include "../processing/EpisodeParser.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace archive
{

struct PrefixSummary
{
    std::string prefix;
    std::size_t files_found = 0;
    std::size_t processed = 0;
    std::size_t skipped = 0;         // unreadable or unparseable files
    std::size_t artifacts_written = 0;
    std::size_t artifacts_failed = 0;
    std::vector<ArtifactRecord> artifacts;
};

// Drives one prefix at a time: lists <data_dir>/<PREFIX>_*.html, orders the files by
// episode number (ties by file name), parses and renders each, and feeds the results
// to a fresh ChunkAssembler writing into the shared sink. An entry that cannot be read
// as a regular file is reported and counted as skipped.
class PrefixProcessor
{
public:
    // Throws std::invalid_argument when config.validate() fails
    PrefixProcessor(std::filesystem::path data_dir, ChunkingConfig config, processing::ParserOptions parser_options,
                    IArtifactSink& sink);

    [[nodiscard]] PrefixSummary process(const std::string& prefix);

    [[nodiscard]] std::vector<std::filesystem::path> listEpisodeFiles(const std::string& prefix) const;

    // Sorted, de-duplicated prefixes of every "<PREFIX>_<n>.html" in data_dir
    [[nodiscard]] static std::vector<std::string> discover_prefixes(const std::filesystem::path& data_dir);

    // nullopt unless the path is a readable regular file
    [[nodiscard]] static std::optional<std::string> read_file(const std::filesystem::path& path);

private:
    std::filesystem::path data_dir_;
    ChunkingConfig config_;
    processing::EpisodeParser parser_;
    IArtifactSink& sink_;
};

} // namespace archive
