#include "PrefixProcessor.hpp"
#include "ChunkAssembler.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <plog/Log.h>

namespace fs = std::filesystem;

namespace archive
{

namespace
{

constexpr const char* kHtmlExtension = ".html";

bool endsWith(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

PrefixProcessor::PrefixProcessor(fs::path data_dir, ChunkingConfig config, processing::ParserOptions parser_options,
                                 IArtifactSink& sink)
    : data_dir_(std::move(data_dir))
    , config_(config)
    , parser_(parser_options)
    , sink_(sink)
{
    if (auto reason = config_.validate())
        throw std::invalid_argument("Invalid chunking configuration: " + *reason);
}

std::optional<std::string> PrefixProcessor::read_file(const fs::path& path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return std::nullopt;

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return std::nullopt;

    std::ostringstream oss;
    oss << ifs.rdbuf();
    if (ifs.bad())
        return std::nullopt;
    return oss.str();
}

std::vector<fs::path> PrefixProcessor::listEpisodeFiles(const std::string& prefix) const
{
    struct Entry
    {
        int episode;
        std::string name;
        fs::path path;
    };
    std::vector<Entry> entries;

    const std::string head = prefix + "_";
    std::error_code ec;
    for (fs::directory_iterator it(data_dir_, ec), end; !ec && it != end; it.increment(ec))
    {
        std::string name = it->path().filename().string();
        if (name.rfind(head, 0) != 0 || !endsWith(name, kHtmlExtension))
            continue;
        entries.push_back({ processing::EpisodeParser::episode_number_from_filename(name), name, it->path() });
    }
    if (ec)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to list transcript directory",
                                          data_dir_.string() + ": " + ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b)
              {
                  if (a.episode != b.episode)
                      return a.episode < b.episode;
                  return a.name < b.name;
              });

    std::vector<fs::path> files;
    files.reserve(entries.size());
    for (auto& entry : entries)
        files.push_back(std::move(entry.path));
    return files;
}

std::vector<std::string> PrefixProcessor::discover_prefixes(const fs::path& data_dir)
{
    static const std::regex kEpisodeFile(R"(([A-Z0-9]+)_\d+\.html)");

    std::set<std::string> prefixes;
    std::error_code ec;
    for (fs::directory_iterator it(data_dir, ec), end; !ec && it != end; it.increment(ec))
    {
        std::string name = it->path().filename().string();
        std::smatch m;
        if (std::regex_match(name, m, kEpisodeFile))
            prefixes.insert(m[1].str());
    }
    if (ec)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to list transcript directory",
                                          data_dir.string() + ": " + ec.message());
    }
    return std::vector<std::string>(prefixes.begin(), prefixes.end());
}

PrefixSummary PrefixProcessor::process(const std::string& prefix)
{
    PROFILE_SCOPE_CUSTOM("PrefixProcessor::process");

    PrefixSummary summary;
    summary.prefix = prefix;

    const std::vector<fs::path> files = listEpisodeFiles(prefix);
    summary.files_found = files.size();
    if (files.empty())
    {
        PLOG_INFO << "No files found for prefix: " << prefix;
        return summary;
    }

    PLOG_INFO << "Processing " << files.size() << " files for " << prefix << " (by year: "
              << (config_.by_year ? "yes" : "no") << ")";

    ChunkAssembler assembler(prefix, config_, sink_);
    for (const auto& path : files)
    {
        std::optional<std::string> markup = read_file(path);
        if (!markup)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to read transcript", path.string());
            ++summary.skipped;
            continue;
        }

        text_processing::RawDocument doc;
        doc.markup = std::move(*markup);
        doc.prefix = prefix;
        doc.source_path = path.string();
        doc.episode_number = processing::EpisodeParser::episode_number_from_filename(path.filename().string());

        try
        {
            text_processing::RenderedEpisode rendered = processing::EpisodeParser::render(parser_.parse(doc));
            assembler.add(rendered);
            ++summary.processed;
        }
        catch (const std::exception& e)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Parsing, "Failed to process transcript",
                                              path.string() + ": " + e.what());
            ++summary.skipped;
        }
    }
    assembler.finish();

    summary.artifacts_written = assembler.artifactsWritten();
    summary.artifacts_failed = assembler.artifactsFailed();
    summary.artifacts = assembler.artifacts();

    PLOG_INFO << prefix << ": processed " << summary.processed << ", skipped " << summary.skipped
              << ", artifacts written " << summary.artifacts_written << ", failed " << summary.artifacts_failed;
    return summary;
}

} // namespace archive
