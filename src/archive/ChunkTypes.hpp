#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace archive
{

// Limits applied per output artifact
struct ChunkingConfig
{
    static constexpr std::int64_t kDefaultMaxWords = 490000;
    static constexpr std::int64_t kDefaultMaxBytes = 190LL * 1024 * 1024;

    std::int64_t max_words = kDefaultMaxWords;
    std::int64_t max_bytes = kDefaultMaxBytes;
    bool by_year = false;

    // Reason the configuration is unusable, nullopt when it is fine
    [[nodiscard]] std::optional<std::string> validate() const;
};

// Open chunk for one prefix
struct ChunkBuffer
{
    std::string content;
    std::size_t episodes = 0;
    std::size_t words = 0;
    std::size_t bytes = 0;
    int first_episode = 0;
    int last_episode = 0;
    int year = 0;                   // year of the first episode

    [[nodiscard]] bool empty() const noexcept { return episodes == 0; }
    void reset();
};

// A finalized chunk, handed to an IArtifactSink
struct OutputArtifact
{
    std::string name;               // without extension
    std::string prefix;
    std::string content;
    int first_episode = 0;
    int last_episode = 0;
    int year = 0;
    std::size_t episodes = 0;
    std::size_t words = 0;
    std::size_t bytes = 0;
};

// What the run report keeps about an artifact once its content is gone
struct ArtifactRecord
{
    std::string name;
    int first_episode = 0;
    int last_episode = 0;
    int year = 0;
    std::size_t episodes = 0;
    std::size_t words = 0;
    std::size_t bytes = 0;
    bool written = false;
};

} // namespace archive
