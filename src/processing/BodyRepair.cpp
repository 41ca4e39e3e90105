#include "BodyRepair.hpp"
#include "TextNormalizer.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace processing
{

namespace
{

constexpr std::string_view kMastheadMarker = "Transcript of Episode #";
constexpr std::string_view kDisclaimerHead = "please be advised this transcript is ai-generated";
constexpr std::array<std::string_view, 3> kDisclaimerTails = { "ad-supported version of the show", "approximate times",
                                                               "word for word" };
constexpr std::size_t kMaxDisclaimerBytes = 2000;

// End of the earliest closing phrase in lower[from, limit), or npos
std::size_t findFirstTail(const std::string& lower, std::size_t from, std::size_t limit)
{
    std::size_t best = std::string::npos;
    for (auto tail : kDisclaimerTails)
    {
        std::size_t hit = lower.find(tail, from);
        if (hit != std::string::npos && hit + tail.size() <= limit && (best == std::string::npos || hit + tail.size() < best))
            best = hit + tail.size();
    }
    return best;
}

// End of the latest closing phrase in lower[from, limit), or npos
std::size_t findLastTail(const std::string& lower, std::size_t from, std::size_t limit)
{
    std::size_t best = std::string::npos;
    for (auto tail : kDisclaimerTails)
    {
        std::size_t hit = lower.find(tail, from);
        while (hit != std::string::npos && hit + tail.size() <= limit)
        {
            if (best == std::string::npos || hit + tail.size() > best)
                best = hit + tail.size();
            hit = lower.find(tail, hit + 1);
        }
    }
    return best;
}

} // anonymous namespace

std::string strip_masthead(const std::string& markup)
{
    std::size_t pos = markup.find(kMastheadMarker);
    while (pos != std::string::npos)
    {
        std::size_t digits = pos + kMastheadMarker.size();
        if (digits < markup.size() && std::isdigit(static_cast<unsigned char>(markup[digits])))
            return markup.substr(pos);
        pos = markup.find(kMastheadMarker, pos + 1);
    }
    return markup;
}

std::string strip_disclaimer(const std::string& text)
{
    std::string lower = to_lower_ascii(text);
    std::size_t head = lower.find(kDisclaimerHead);
    if (head == std::string::npos)
        return text;

    std::string out;
    std::size_t pos = 0;
    bool removed = false;
    while (head != std::string::npos)
    {
        std::size_t search_from = head + kDisclaimerHead.size();
        std::size_t line_end = lower.find('\n', search_from);
        if (line_end == std::string::npos)
            line_end = lower.size();

        std::size_t end = findLastTail(lower, search_from, line_end);
        if (end == std::string::npos)
            end = findFirstTail(lower, search_from, std::min(lower.size(), head + kMaxDisclaimerBytes));
        if (end == std::string::npos)
        {
            // Head without any closing phrase; leave it in place
            head = lower.find(kDisclaimerHead, search_from);
            continue;
        }

        std::size_t begin = head;
        if (begin > pos && text[begin - 1] == '*')
            --begin;
        if (end < text.size() && text[end] == '.')
            ++end;
        if (end < text.size() && text[end] == '*')
            ++end;

        out.append(text, pos, begin - pos);
        pos = end;
        removed = true;
        head = lower.find(kDisclaimerHead, pos);
    }
    if (!removed)
        return text;
    out.append(text, pos, std::string::npos);

    return collapse_blank_lines(out);
}

} // namespace processing
