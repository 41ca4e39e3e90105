#include "MarkupSanitizer.hpp"
#include "MarkupScan.hpp"
#include "TextNormalizer.hpp"
#include "TextUtils.hpp"

#include <array>
#include <optional>
#include <utility>

namespace processing
{

namespace
{

using markup::npos;

struct Entity
{
    std::string_view name;
    char value;
};

constexpr std::array<Entity, 6> kEntities = { {
    { "&nbsp;", ' ' },
    { "&amp;", '&' },
    { "&lt;", '<' },
    { "&gt;", '>' },
    { "&quot;", '"' },
    { "&#39;", '\'' },
} };

struct PairedRule
{
    std::string_view tag;
    std::string_view open_repl;
    std::string_view close_repl;
};

} // anonymous namespace

std::string MarkupSanitizer::sanitize(const std::string& markup) const
{
    std::string current = markup;
    for (;;)
    {
        std::string next = sanitizeOnce(current);
        if (next == current)
            return next;
        current = std::move(next);
    }
}

std::string MarkupSanitizer::sanitizeOnce(const std::string& markup) const
{
    if (markup.empty())
        return markup;

    std::string text = removeHiddenBlocks(normalize_line_endings(markup));

    static constexpr std::array<PairedRule, 4> kBlockRules = { {
        { "h1", "# ", "\n\n" },
        { "h2", "## ", "\n\n" },
        { "h3", "### ", "\n\n" },
        { "p", "", "\n\n" },
    } };
    for (const auto& rule : kBlockRules)
        text = convertPaired(text, rule.tag, rule.open_repl, rule.close_repl);

    text = convertStandalone(text, "br", false, "\n");

    static constexpr std::array<PairedRule, 4> kInlineRules = { {
        { "b", "**", "**" },
        { "strong", "**", "**" },
        { "i", "*", "*" },
        { "em", "*", "*" },
    } };
    for (const auto& rule : kInlineRules)
        text = convertPaired(text, rule.tag, rule.open_repl, rule.close_repl);

    text = convertAnchors(text);

    text = convertStandalone(text, "ul", false, "");
    text = convertStandalone(text, "ul", true, "\n");
    text = convertPaired(text, "li", "* ", "\n");

    text = stripTags(text);
    text = decodeEntities(text);

    return collapse_blank_lines(text);
}

bool MarkupSanitizer::isSafeLinkTarget(std::string_view target) noexcept
{
    return target.rfind("/", 0) == 0 || target.rfind("http://", 0) == 0 || target.rfind("https://", 0) == 0;
}

std::string MarkupSanitizer::decodeEntities(const std::string& text)
{
    if (text.find('&') == npos)
        return text;

    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t amp = text.find('&', pos);
        if (amp == npos)
        {
            out.append(text, pos, npos);
            break;
        }
        out.append(text, pos, amp - pos);

        bool decoded = false;
        for (const auto& entity : kEntities)
        {
            if (text.compare(amp, entity.name.size(), entity.name) == 0)
            {
                out.push_back(entity.value);
                pos = amp + entity.name.size();
                decoded = true;
                break;
            }
        }
        if (!decoded)
        {
            out.push_back('&');
            pos = amp + 1;
        }
    }
    return out;
}

std::string MarkupSanitizer::stripTags(const std::string& text)
{
    // Past these offsets no tag or comment can be terminated; avoids rescanning to the end
    const std::size_t last_gt = text.rfind('>');
    const std::size_t last_comment_close = text.rfind("-->");

    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t lt = text.find('<', pos);
        if (lt == npos)
        {
            out.append(text, pos, npos);
            break;
        }
        out.append(text, pos, lt - pos);

        std::size_t end = npos;
        if (last_comment_close != npos && lt + 4 <= last_comment_close && text.compare(lt, 4, "<!--") == 0)
        {
            std::size_t close = text.find("-->", lt + 4);
            if (close != npos)
                end = close + 3;
        }

        if (end == npos && lt + 1 < text.size())
        {
            char next = text[lt + 1];
            bool tag_like = markup::is_ascii_alpha(next) || next == '!' || next == '?' ||
                            (next == '/' && lt + 2 < text.size() && markup::is_ascii_alpha(text[lt + 2]));
            if (tag_like && last_gt != npos && lt < last_gt)
                end = markup::tag_end(text, lt);
        }

        if (end == npos)
        {
            // Literal '<' in prose
            out.push_back('<');
            pos = lt + 1;
        }
        else
        {
            pos = end;
        }
    }
    return out;
}

std::string MarkupSanitizer::removeHiddenBlocks(const std::string& input) const
{
    std::string text = input;
    for (std::string_view tag : { std::string_view("script"), std::string_view("style") })
    {
        std::string out;
        out.reserve(text.size());
        std::size_t pos = 0;
        while (pos < text.size())
        {
            std::size_t open = markup::find_tag(text, pos, tag, false);
            std::size_t close = open == npos ? npos : markup::find_tag(text, open + 1, tag, true);
            std::size_t close_end = close == npos ? npos : markup::tag_end(text, close);
            if (close_end == npos)
            {
                // Unterminated block: leave it for the generic tag strip
                out.append(text, pos, npos);
                break;
            }
            out.append(text, pos, open - pos);
            pos = close_end;
        }
        text = std::move(out);
    }
    return text;
}

std::string MarkupSanitizer::convertPaired(const std::string& input, std::string_view tag,
                                           std::string_view open_repl, std::string_view close_repl) const
{
    std::string out;
    out.reserve(input.size());
    std::size_t pos = 0;
    while (pos < input.size())
    {
        std::size_t open = markup::find_tag(input, pos, tag, false);
        if (open == npos)
        {
            out.append(input, pos, npos);
            break;
        }

        std::size_t open_end = markup::tag_end(input, open);
        std::size_t close = open_end == npos ? npos : markup::find_tag(input, open_end, tag, true);
        std::size_t close_end = close == npos ? npos : markup::tag_end(input, close);
        if (close_end == npos)
        {
            // No complete closing tag after this opening tag, so none after any later one either.
            // The rest is left to the generic tag strip.
            out.append(input, pos, npos);
            break;
        }

        out.append(input, pos, open - pos);
        out += open_repl;
        out.append(input, open_end, close - open_end);
        out += close_repl;
        pos = close_end;
    }
    return out;
}

std::string MarkupSanitizer::convertStandalone(const std::string& input, std::string_view tag, bool closing,
                                               std::string_view repl) const
{
    std::string out;
    out.reserve(input.size());
    std::size_t pos = 0;
    while (pos < input.size())
    {
        std::size_t lt = markup::find_tag(input, pos, tag, closing);
        std::size_t end = lt == npos ? npos : markup::tag_end(input, lt);
        if (end == npos)
        {
            out.append(input, pos, npos);
            break;
        }
        out.append(input, pos, lt - pos);
        out += repl;
        pos = end;
    }
    return out;
}

std::string MarkupSanitizer::convertAnchors(const std::string& input) const
{
    std::string out;
    out.reserve(input.size());
    std::size_t pos = 0;
    while (pos < input.size())
    {
        std::size_t open = markup::find_tag(input, pos, "a", false);
        if (open == npos)
        {
            out.append(input, pos, npos);
            break;
        }

        std::size_t open_end = markup::tag_end(input, open);
        std::size_t close = open_end == npos ? npos : markup::find_tag(input, open_end, "a", true);
        std::size_t close_end = close == npos ? npos : markup::tag_end(input, close);
        if (close_end == npos)
        {
            out.append(input, pos, npos);
            break;
        }

        out.append(input, pos, open - pos);

        std::string_view attrs = markup::tag_attributes(input, open, open_end, "a");
        std::string_view content = std::string_view(input).substr(open_end, close - open_end);
        std::optional<std::string> target = markup::attribute_value(attrs, "href");

        if (target && isSafeLinkTarget(*target))
        {
            out += '[';
            out += content;
            out += "](";
            out += *target;
            out += ')';
        }
        else
        {
            out += content;
        }
        pos = close_end;
    }
    return out;
}

} // namespace processing
