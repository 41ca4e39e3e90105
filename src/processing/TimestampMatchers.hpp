#pragma once

#include "ITimestampMatcher.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

// Longest text accepted in front of a bracketed/parenthesized timestamp as a speaker name
constexpr std::size_t kMaxSpeakerPrefix = 80;

// Longest "Name" accepted after a leading timestamp ("0:08:43 - Name")
constexpr std::size_t kMaxLeadingSpeaker = 40;

// "0:08:43 - Leo Laporte", "0:08:43 - Leo Laporte: text", "0:08:43 - spoken text", "0:08:43"
class LeadingTimestampMatcher : public ITimestampMatcher
{
public:
    [[nodiscard]] const char* name() const noexcept override { return "leading_timestamp"; }
    [[nodiscard]] text_processing::MatchResult tryMatch(const std::string& line) const override;
};

// "Leo Laporte [0:00:52]: text"
class SpeakerBracketMatcher : public ITimestampMatcher
{
public:
    [[nodiscard]] const char* name() const noexcept override { return "speaker_bracket"; }
    [[nodiscard]] text_processing::MatchResult tryMatch(const std::string& line) const override;
};

// "Leo Laporte (0:00:52): text"
class SpeakerParenMatcher : public ITimestampMatcher
{
public:
    [[nodiscard]] const char* name() const noexcept override { return "speaker_paren"; }
    [[nodiscard]] text_processing::MatchResult tryMatch(const std::string& line) const override;
};

// "(0:00:52): text"
class BareParenMatcher : public ITimestampMatcher
{
public:
    [[nodiscard]] const char* name() const noexcept override { return "bare_paren"; }
    [[nodiscard]] text_processing::MatchResult tryMatch(const std::string& line) const override;
};

// The four shapes in priority order
[[nodiscard]] std::vector<std::unique_ptr<ITimestampMatcher>> make_default_cascade();

// Merge-suppression test for the line after a bare marker. Deliberately looser than
// the cascade: a line starting with "H:MM", starting with "(H:MM", or carrying
// "[H:MM" / "(H:MM" within kMaxSpeakerPrefix characters counts as a new marker.
// A line that merely starts with digits ("2024 was ...") does not.
[[nodiscard]] bool looks_like_marker(const std::string& line);

// "Leo Laporte", "Dr. Jane O'Neil": 1-6 capitalised words, no trailing period
[[nodiscard]] bool looks_like_speaker_name(std::string_view candidate);

// Removes ':' / whitespace residue left in front of captured text; a residue made only of
// emphasis markers ("**") yields empty text. With emphasized_speaker, a run of '*' closing
// the speaker's emphasis ("** Hello") is dropped as well.
[[nodiscard]] std::string strip_marker_residue(std::string_view text, bool emphasized_speaker = false);

} // namespace processing
