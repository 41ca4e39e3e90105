#include "ArtifactWriter.hpp"
#include "../utils/ErrorReporter.hpp"

#include <fstream>
#include <system_error>
#include <plog/Log.h>

namespace fs = std::filesystem;

namespace archive
{

ArtifactWriter::ArtifactWriter(fs::path output_dir)
    : output_dir_(std::move(output_dir))
{
}

fs::path ArtifactWriter::pathFor(const std::string& name) const { return output_dir_ / (name + kExtension); }

bool ArtifactWriter::ensureDirectory()
{
    if (directory_ready_ || output_dir_.empty())
        return true;

    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to create output directory",
                                          output_dir_.string() + ": " + ec.message());
        return false;
    }
    directory_ready_ = true;
    return true;
}

bool ArtifactWriter::write(const OutputArtifact& artifact)
{
    if (!ensureDirectory())
        return false;

    const fs::path target = pathFor(artifact.name);
    fs::path tmp = target;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to write artifact",
                                              "Could not create temporary file: " + tmp.string());
            return false;
        }
        ofs.write(artifact.content.data(), static_cast<std::streamsize>(artifact.content.size()));
        ofs.flush();
        if (!ofs)
        {
            ofs.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to write artifact",
                                              "Short write to " + tmp.string());
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec)
    {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to write artifact",
                                          "Could not rename " + tmp.string() + ": " + ec.message());
        return false;
    }

    PLOG_INFO << "Written " << target.string() << " (episodes " << artifact.first_episode << "-"
              << artifact.last_episode << ", words " << artifact.words << ", bytes " << artifact.bytes << ")";
    return true;
}

} // namespace archive
