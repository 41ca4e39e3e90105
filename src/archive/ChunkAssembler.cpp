#include "ChunkAssembler.hpp"

#include <stdexcept>
#include <utility>
#include <plog/Log.h>

namespace archive
{

ChunkAssembler::ChunkAssembler(std::string prefix, ChunkingConfig config, IArtifactSink& sink)
    : prefix_(std::move(prefix))
    , config_(config)
    , sink_(sink)
{
    if (auto reason = config_.validate())
        throw std::invalid_argument("Invalid chunking configuration: " + *reason);
}

bool ChunkAssembler::shouldSplit(const text_processing::RenderedEpisode& episode) const
{
    if (buffer_.empty())
        return false;

    const auto max_words = static_cast<std::size_t>(config_.max_words);
    const auto max_bytes = static_cast<std::size_t>(config_.max_bytes);
    if (buffer_.words + episode.words > max_words || buffer_.bytes + episode.bytes > max_bytes)
        return true;

    return config_.by_year && episode.year != buffer_.year;
}

void ChunkAssembler::add(const text_processing::RenderedEpisode& episode)
{
    if (has_previous_ && episode.episode_number <= previous_episode_)
    {
        PLOG_WARNING << prefix_ << ": episode " << episode.episode_number << " follows episode " << previous_episode_
                     << "; keeping encountered order";
    }
    has_previous_ = true;
    previous_episode_ = episode.episode_number;

    if (shouldSplit(episode))
        flush();

    if (buffer_.empty())
    {
        buffer_.first_episode = episode.episode_number;
        buffer_.year = episode.year;
    }

    buffer_.content += episode.block;
    buffer_.words += episode.words;
    buffer_.bytes += episode.bytes;
    buffer_.last_episode = episode.episode_number;
    ++buffer_.episodes;
    ++episodes_added_;

    if (episode.words > static_cast<std::size_t>(config_.max_words) ||
        episode.bytes > static_cast<std::size_t>(config_.max_bytes))
    {
        PLOG_WARNING << prefix_ << ": episode " << episode.episode_number << " alone exceeds the chunk limits ("
                     << episode.words << " words, " << episode.bytes << " bytes)";
    }
}

void ChunkAssembler::finish()
{
    if (!buffer_.empty())
        flush();
}

std::string ChunkAssembler::artifact_name(const std::string& prefix, int first_episode, int last_episode, int year,
                                          bool by_year)
{
    if (by_year && year > 0)
    {
        return prefix + "_Transcripts_" + std::to_string(year) + "_" + std::to_string(first_episode) + "_" +
               std::to_string(last_episode);
    }
    return prefix + "_Transcripts_" + std::to_string(first_episode) + "-" + std::to_string(last_episode);
}

void ChunkAssembler::flush()
{
    OutputArtifact artifact;
    artifact.name = artifact_name(prefix_, buffer_.first_episode, buffer_.last_episode, buffer_.year, config_.by_year);
    artifact.prefix = prefix_;
    artifact.content = std::move(buffer_.content);
    artifact.first_episode = buffer_.first_episode;
    artifact.last_episode = buffer_.last_episode;
    artifact.year = buffer_.year;
    artifact.episodes = buffer_.episodes;
    artifact.words = buffer_.words;
    artifact.bytes = buffer_.bytes;
    buffer_.reset();

    ArtifactRecord record{ artifact.name,  artifact.first_episode, artifact.last_episode, artifact.year,
                           artifact.episodes, artifact.words,       artifact.bytes,        false };

    record.written = sink_.write(artifact);
    if (record.written)
    {
        ++artifacts_written_;
    }
    else
    {
        ++artifacts_failed_;
        PLOG_ERROR << prefix_ << ": artifact " << artifact.name << " was not written";
    }
    artifacts_.push_back(std::move(record));
}

} // namespace archive
