#pragma once

#include "TextProcessingTypes.hpp"

#include <string>

namespace processing
{

// One recognizable timestamp/speaker line shape
class ITimestampMatcher
{
public:
    virtual ~ITimestampMatcher() = default;

    // Short identifier used in diagnostics, e.g. "speaker_bracket"
    [[nodiscard]] virtual const char* name() const noexcept = 0;

    // NoMatch, MatchedWithText when text follows the marker on the same line,
    // MatchedNeedingLookahead when the marker stands alone
    [[nodiscard]] virtual text_processing::MatchResult tryMatch(const std::string& line) const = 0;
};

} // namespace processing
