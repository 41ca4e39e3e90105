#include "ChunkTypes.hpp"

namespace archive
{

std::optional<std::string> ChunkingConfig::validate() const
{
    if (max_words <= 0)
        return "max_words must be positive (got " + std::to_string(max_words) + ")";
    if (max_bytes <= 0)
        return "max_bytes must be positive (got " + std::to_string(max_bytes) + ")";
    return std::nullopt;
}

void ChunkBuffer::reset()
{
    content.clear();
    episodes = 0;
    words = 0;
    bytes = 0;
    first_episode = 0;
    last_episode = 0;
    year = 0;
}

} // namespace archive
