#pragma once

#include "ChunkTypes.hpp"
#include "IArtifactSink.hpp"
#include "../processing/TextProcessingTypes.hpp"

#include <string>
#include <vector>

namespace archive
{

// Packs one prefix's rendered episodes, in ascending episode order, into artifacts
// bounded by word count, byte size and optionally calendar year.
//
// A split happens before an episode whose words or bytes would push the open chunk
// past a limit, or (by_year) whose year differs from the chunk's. The open chunk is
// never split while empty, so an oversized episode ends up alone in its artifact.
class ChunkAssembler
{
public:
    // Throws std::invalid_argument when config.validate() fails
    ChunkAssembler(std::string prefix, ChunkingConfig config, IArtifactSink& sink);

    void add(const text_processing::RenderedEpisode& episode);

    // Flushes the open chunk if it holds anything
    void finish();

    [[nodiscard]] bool shouldSplit(const text_processing::RenderedEpisode& episode) const;

    // "{P}_Transcripts_{first}-{last}" or "{P}_Transcripts_{year}_{first}_{last}"
    [[nodiscard]] static std::string artifact_name(const std::string& prefix, int first_episode, int last_episode,
                                                   int year, bool by_year);

    [[nodiscard]] const ChunkingConfig& config() const noexcept { return config_; }
    [[nodiscard]] const ChunkBuffer& buffer() const noexcept { return buffer_; }
    [[nodiscard]] const std::vector<ArtifactRecord>& artifacts() const noexcept { return artifacts_; }
    [[nodiscard]] std::size_t episodesAdded() const noexcept { return episodes_added_; }
    [[nodiscard]] std::size_t artifactsWritten() const noexcept { return artifacts_written_; }
    [[nodiscard]] std::size_t artifactsFailed() const noexcept { return artifacts_failed_; }

private:
    void flush();

    std::string prefix_;
    ChunkingConfig config_;
    IArtifactSink& sink_;
    ChunkBuffer buffer_;
    std::vector<ArtifactRecord> artifacts_;
    std::size_t episodes_added_ = 0;
    std::size_t artifacts_written_ = 0;
    std::size_t artifacts_failed_ = 0;
    bool has_previous_ = false;
    int previous_episode_ = 0;
};

} // namespace archive
