#include "RunReport.hpp"
#include "../utils/ErrorReporter.hpp"

#include <fstream>
#include <system_error>
#include <plog/Log.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace archive
{

namespace
{

json artifactToJson(const ArtifactRecord& record)
{
    return json{ { "name", record.name },
                 { "first_episode", record.first_episode },
                 { "last_episode", record.last_episode },
                 { "year", record.year },
                 { "episodes", record.episodes },
                 { "words", record.words },
                 { "bytes", record.bytes },
                 { "written", record.written } };
}

} // anonymous namespace

void RunReport::add(PrefixSummary summary) { prefixes_.push_back(std::move(summary)); }

std::size_t RunReport::totalProcessed() const
{
    std::size_t total = 0;
    for (const auto& p : prefixes_)
        total += p.processed;
    return total;
}

std::size_t RunReport::totalSkipped() const
{
    std::size_t total = 0;
    for (const auto& p : prefixes_)
        total += p.skipped;
    return total;
}

std::size_t RunReport::totalArtifactsWritten() const
{
    std::size_t total = 0;
    for (const auto& p : prefixes_)
        total += p.artifacts_written;
    return total;
}

std::size_t RunReport::totalArtifactsFailed() const
{
    std::size_t total = 0;
    for (const auto& p : prefixes_)
        total += p.artifacts_failed;
    return total;
}

json RunReport::toJson() const
{
    json prefixes = json::array();
    for (const auto& p : prefixes_)
    {
        json artifacts = json::array();
        for (const auto& record : p.artifacts)
            artifacts.push_back(artifactToJson(record));

        prefixes.push_back({ { "prefix", p.prefix },
                             { "files_found", p.files_found },
                             { "processed", p.processed },
                             { "skipped", p.skipped },
                             { "artifacts_written", p.artifacts_written },
                             { "artifacts_failed", p.artifacts_failed },
                             { "artifacts", std::move(artifacts) } });
    }

    return json{ { "prefixes", std::move(prefixes) },
                 { "totals",
                   { { "processed", totalProcessed() },
                     { "skipped", totalSkipped() },
                     { "artifacts_written", totalArtifactsWritten() },
                     { "artifacts_failed", totalArtifactsFailed() } } } };
}

bool RunReport::writeTo(const fs::path& path) const
{
    std::error_code ec;
    if (path.has_parent_path())
    {
        fs::create_directories(path.parent_path(), ec);
        if (ec)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to write run report",
                                              path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to write run report",
                                              "Could not create temporary file: " + tmp.string());
            return false;
        }
        ofs << toJson().dump(2) << '\n';
        if (!ofs)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to write run report",
                                              "Short write to " + tmp.string());
            return false;
        }
    }

    fs::rename(tmp, path, ec);
    if (ec)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to write run report",
                                          "Could not rename " + tmp.string() + ": " + ec.message());
        return false;
    }

    PLOG_INFO << "Run report written to " << path.string();
    return true;
}

std::string RunReport::summaryLine() const
{
    return "processed " + std::to_string(totalProcessed()) + ", skipped " + std::to_string(totalSkipped()) +
           ", artifacts written " + std::to_string(totalArtifactsWritten()) + ", artifacts failed " +
           std::to_string(totalArtifactsFailed());
}

} // namespace archive
