#pragma once

#include "IArtifactSink.hpp"

#include <filesystem>

namespace archive
{

// Writes artifacts to <output_dir>/<name>.md through a temporary file and rename.
// The output directory is created on first use.
class ArtifactWriter : public IArtifactSink
{
public:
    static constexpr const char* kExtension = ".md";

    explicit ArtifactWriter(std::filesystem::path output_dir);

    [[nodiscard]] bool write(const OutputArtifact& artifact) override;

    [[nodiscard]] std::filesystem::path pathFor(const std::string& name) const;
    [[nodiscard]] const std::filesystem::path& outputDirectory() const noexcept { return output_dir_; }

private:
    bool ensureDirectory();

    std::filesystem::path output_dir_;
    bool directory_ready_ = false;
};

} // namespace archive
