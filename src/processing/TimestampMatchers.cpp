#include "TimestampMatchers.hpp"
#include "TextUtils.hpp"

#include <regex>

namespace processing
{

using text_processing::MatchedNeedingLookahead;
using text_processing::MatchedWithText;
using text_processing::MatchResult;
using text_processing::NoMatch;
using text_processing::NormalizedLine;

namespace
{

// Only the marker head is matched by regex; the remainder of the line is taken by offset so
// long dialogue lines never run through the backtracking matcher.
const std::string kTimestamp = R"((\d+:\d+(?::\d+)?))";
const std::string kSpeakerPrefix = "(.{1," + std::to_string(kMaxSpeakerPrefix) + "}?)";

bool searchHead(const std::string& line, const std::regex& head, std::smatch& m)
{
    return std::regex_search(line, m, head, std::regex_constants::match_continuous);
}

std::string cleanSpeaker(std::string_view raw)
{
    std::string speaker = trim_unicode(raw);
    std::size_t begin = speaker.find_first_not_of('*');
    if (begin == std::string::npos)
        return std::string();
    std::size_t end = speaker.find_last_not_of('*');
    return trim_unicode(std::string_view(speaker).substr(begin, end - begin + 1));
}

MatchResult makeResult(std::string timestamp, std::string speaker, std::string text)
{
    NormalizedLine line{ std::move(timestamp), std::move(speaker), std::move(text) };
    if (line.text.empty())
        return MatchedNeedingLookahead{ std::move(line) };
    return MatchedWithText{ std::move(line) };
}

bool isNameByte(unsigned char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '\'' || c == '.' || c == '-' || c >= 0x80;
}

// Speaker label followed by the trailing-text residue of a bracket/paren marker
MatchResult matchSpeakerForm(const std::string& line, const std::regex& head)
{
    std::smatch m;
    if (!searchHead(line, head, m))
        return NoMatch{};

    std::string raw_speaker = trim_unicode(m[1].str());
    std::string rest = line.substr(static_cast<std::size_t>(m.length(0)));
    bool emphasized = !raw_speaker.empty() && raw_speaker.front() == '*';
    return makeResult(m[2].str(), cleanSpeaker(raw_speaker), strip_marker_residue(rest, emphasized));
}

} // anonymous namespace

MatchResult LeadingTimestampMatcher::tryMatch(const std::string& line) const
{
    static const std::regex head("^" + kTimestamp + R"(\s*(?:-\s*)?)");

    std::smatch m;
    if (!searchHead(line, head, m))
        return NoMatch{};

    std::string timestamp = m[1].str();
    std::string rest = trim_unicode(std::string_view(line).substr(static_cast<std::size_t>(m.length(0))));

    // "Name" or "Name: text" after the timestamp is a speaker label; anything else is dialogue
    std::size_t colon = rest.find(':');
    std::string candidate = cleanSpeaker(std::string_view(rest).substr(0, colon));
    if (!candidate.empty() && looks_like_speaker_name(candidate))
    {
        std::string text = colon == std::string::npos ? std::string()
                                                      : strip_marker_residue(std::string_view(rest).substr(colon),
                                                                             rest.front() == '*');
        return makeResult(std::move(timestamp), std::move(candidate), std::move(text));
    }

    return makeResult(std::move(timestamp), std::string(), strip_marker_residue(rest));
}

MatchResult SpeakerBracketMatcher::tryMatch(const std::string& line) const
{
    static const std::regex head("^" + kSpeakerPrefix + R"(\s*\[)" + kTimestamp + R"(\])");
    return matchSpeakerForm(line, head);
}

MatchResult SpeakerParenMatcher::tryMatch(const std::string& line) const
{
    static const std::regex head("^" + kSpeakerPrefix + R"(\s*\()" + kTimestamp + R"(\))");
    return matchSpeakerForm(line, head);
}

MatchResult BareParenMatcher::tryMatch(const std::string& line) const
{
    static const std::regex head(R"(^\()" + kTimestamp + R"(\))");

    std::smatch m;
    if (!searchHead(line, head, m))
        return NoMatch{};

    std::string rest = line.substr(static_cast<std::size_t>(m.length(0)));
    return makeResult(m[1].str(), std::string(), strip_marker_residue(rest));
}

std::vector<std::unique_ptr<ITimestampMatcher>> make_default_cascade()
{
    std::vector<std::unique_ptr<ITimestampMatcher>> cascade;
    cascade.push_back(std::make_unique<LeadingTimestampMatcher>());
    cascade.push_back(std::make_unique<SpeakerBracketMatcher>());
    cascade.push_back(std::make_unique<SpeakerParenMatcher>());
    cascade.push_back(std::make_unique<BareParenMatcher>());
    return cascade;
}

bool looks_like_marker(const std::string& line)
{
    static const std::regex marker(R"(^(?:\d+:\d+|\(\d+:\d+|)" + kSpeakerPrefix + R"(\s*[\[(]\d+:\d+))");
    std::smatch m;
    return std::regex_search(line, m, marker, std::regex_constants::match_continuous);
}

bool looks_like_speaker_name(std::string_view candidate)
{
    if (candidate.empty() || candidate.size() > kMaxLeadingSpeaker || candidate.back() == '.')
        return false;

    std::size_t words = 0;
    std::size_t pos = 0;
    while (pos < candidate.size())
    {
        while (pos < candidate.size() && candidate[pos] == ' ')
            ++pos;
        if (pos >= candidate.size())
            break;

        auto first = static_cast<unsigned char>(candidate[pos]);
        if (!((first >= 'A' && first <= 'Z') || first >= 0x80))
            return false;

        while (pos < candidate.size() && candidate[pos] != ' ')
        {
            if (!isNameByte(static_cast<unsigned char>(candidate[pos])))
                return false;
            ++pos;
        }
        if (++words > 6)
            return false;
    }
    return words > 0;
}

std::string strip_marker_residue(std::string_view text, bool emphasized_speaker)
{
    std::size_t begin = 0;
    while (begin < text.size() && (text[begin] == ':' || text[begin] == ' ' || text[begin] == '\t'))
        ++begin;

    std::string stripped = trim_unicode(text.substr(begin));
    std::size_t stars = stripped.find_first_not_of('*');
    if (stars == std::string::npos)
        return std::string();

    // Closing half of "**Name [0:01]:**" or "**Name [0:01]**:" in front of the dialogue
    char after = stripped[stars];
    if (emphasized_speaker && stars > 0 && (after == ' ' || after == '\t' || after == ':'))
        return strip_marker_residue(std::string_view(stripped).substr(stars));
    return stripped;
}

} // namespace processing
