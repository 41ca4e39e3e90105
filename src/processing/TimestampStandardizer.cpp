#include "TimestampStandardizer.hpp"
#include "Diagnostics.hpp"
#include "TextNormalizer.hpp"
#include "TextUtils.hpp"
#include "TimestampMatchers.hpp"

#include <type_traits>
#include <variant>
#include <plog/Log.h>

namespace processing
{

using text_processing::MatchedNeedingLookahead;
using text_processing::MatchedWithText;
using text_processing::MatchResult;
using text_processing::NoMatch;
using text_processing::NormalizedLine;

TimestampStandardizer::TimestampStandardizer()
    : cascade_(make_default_cascade())
{
}

TimestampStandardizer::TimestampStandardizer(std::vector<std::unique_ptr<ITimestampMatcher>> cascade)
    : cascade_(std::move(cascade))
{
}

TimestampStandardizer::~TimestampStandardizer() = default;

MatchResult TimestampStandardizer::classify(const std::string& line) const
{
    for (const auto& matcher : cascade_)
    {
        MatchResult result = matcher->tryMatch(line);
        if (!std::holds_alternative<NoMatch>(result))
        {
            if (Diagnostics::IsVerbose())
            {
                PLOG_VERBOSE_(Diagnostics::kLogInstance)
                    << "[TimestampStandardizer] shape=" << matcher->name() << " line=" << Diagnostics::Preview(line);
            }
            return result;
        }
    }
    return NoMatch{};
}

std::vector<std::string> TimestampStandardizer::standardize(const std::vector<std::string>& lines,
                                                            int episode_number, const std::string& date_key) const
{
    std::vector<std::string> out;
    out.reserve(lines.size());

    std::size_t merged = 0;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const std::string& line = lines[i];
        if (line.empty())
        {
            out.emplace_back();
            continue;
        }

        MatchResult result = classify(line);
        std::visit(
            [&](auto&& match)
            {
                using T = std::decay_t<decltype(match)>;
                if constexpr (std::is_same_v<T, NoMatch>)
                {
                    out.push_back(line);
                }
                else if constexpr (std::is_same_v<T, MatchedWithText>)
                {
                    out.push_back(render(episode_number, date_key, match.line));
                }
                else
                {
                    NormalizedLine utterance = match.line;
                    if (i + 1 < lines.size())
                    {
                        std::string next = trim_unicode(lines[i + 1]);
                        if (!next.empty() && !looks_like_marker(next))
                        {
                            utterance.text = std::move(next);
                            ++i;
                            ++merged;
                        }
                    }
                    out.push_back(render(episode_number, date_key, utterance));
                }
            },
            result);
    }

    if (Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[TimestampStandardizer] ep=" << episode_number << " lines_in="
                                               << lines.size() << " lines_out=" << out.size() << " merged=" << merged;
    }
    return out;
}

std::string TimestampStandardizer::standardizeText(const std::string& text, int episode_number,
                                                   const std::string& date_key) const
{
    if (text.empty())
        return text;
    return trim_unicode(join_lines(standardize(split_lines(text), episode_number, date_key)));
}

std::string TimestampStandardizer::renderPrefix(int episode_number, const std::string& date_key,
                                                const NormalizedLine& line)
{
    std::string prefix = "EP:" + std::to_string(episode_number) + " Date:" + date_key + " TS:" + line.timestamp + " -";
    if (!line.speaker.empty())
    {
        prefix += ' ';
        prefix += line.speaker;
    }
    return prefix;
}

std::string TimestampStandardizer::render(int episode_number, const std::string& date_key, const NormalizedLine& line)
{
    std::string rendered = renderPrefix(episode_number, date_key, line);
    if (!line.text.empty())
    {
        rendered += ' ';
        rendered += line.text;
    }
    return rendered;
}

} // namespace processing
