#include "TextUtils.hpp"
#include <utf8proc.h>

namespace processing
{

namespace
{

// Decodes one code point at pos. Invalid bytes are consumed one at a time and reported as -1.
std::size_t decodeAt(std::string_view text, std::size_t pos, utf8proc_int32_t& codepoint)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data() + pos);
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(text.size() - pos);
    utf8proc_ssize_t bytes = utf8proc_iterate(str, len, &codepoint);
    if (bytes <= 0)
    {
        codepoint = -1;
        return 1;
    }
    return static_cast<std::size_t>(bytes);
}

bool isSpaceAt(std::string_view text, std::size_t pos, std::size_t& width)
{
    utf8proc_int32_t cp = 0;
    width = decodeAt(text, pos, cp);
    return cp >= 0 && isUnicodeSpace(static_cast<char32_t>(cp));
}

} // anonymous namespace

bool isUnicodeSpace(char32_t cp)
{
    if (cp == U'\t' || cp == U'\n' || cp == U'\v' || cp == U'\f' || cp == U'\r' || cp == U' ')
        return true;
    if (cp < 0x80)
        return false;
    if (cp == 0x85)
        return true;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

std::string trim_unicode(std::string_view text)
{
    std::size_t begin = 0;
    std::size_t end = 0;
    std::size_t pos = 0;
    bool seen_content = false;

    while (pos < text.size())
    {
        std::size_t width = 0;
        bool space = isSpaceAt(text, pos, width);
        if (!space)
        {
            if (!seen_content)
            {
                begin = pos;
                seen_content = true;
            }
            end = pos + width;
        }
        pos += width;
    }

    if (!seen_content)
        return std::string();
    return std::string(text.substr(begin, end - begin));
}

std::size_t count_words(std::string_view text)
{
    std::size_t words = 0;
    bool in_word = false;
    std::size_t pos = 0;

    while (pos < text.size())
    {
        std::size_t width = 0;
        if (isSpaceAt(text, pos, width))
        {
            in_word = false;
        }
        else if (!in_word)
        {
            in_word = true;
            ++words;
        }
        pos += width;
    }
    return words;
}

std::string collapse_whitespace(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    std::size_t pos = 0;

    while (pos < text.size())
    {
        std::size_t width = 0;
        if (isSpaceAt(text, pos, width))
        {
            pending_space = !out.empty();
        }
        else
        {
            if (pending_space)
                out.push_back(' ');
            pending_space = false;
            out.append(text.data() + pos, width);
        }
        pos += width;
    }
    return out;
}

bool starts_with_icase(std::string_view text, std::string_view prefix)
{
    if (text.size() < prefix.size())
        return false;
    for (std::size_t i = 0; i < prefix.size(); ++i)
    {
        char a = text[i];
        char b = prefix[i];
        if (a >= 'A' && a <= 'Z')
            a = static_cast<char>(a - 'A' + 'a');
        if (b >= 'A' && b <= 'Z')
            b = static_cast<char>(b - 'A' + 'a');
        if (a != b)
            return false;
    }
    return true;
}

std::string to_lower_ascii(std::string_view text)
{
    std::string out(text);
    for (auto& c : out)
    {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

} // namespace processing
