#include "MarkupScan.hpp"
#include "TextUtils.hpp"

namespace processing::markup
{

bool is_space(char c) noexcept { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }

bool is_ascii_alpha(char c) noexcept { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

bool is_tag_named(std::string_view s, std::size_t lt, std::string_view name, bool closing)
{
    if (lt >= s.size() || s[lt] != '<')
        return false;
    std::size_t i = lt + 1;
    if (closing)
    {
        if (i >= s.size() || s[i] != '/')
            return false;
        ++i;
    }
    if (!starts_with_icase(s.substr(i), name))
        return false;
    i += name.size();
    return i < s.size() && (is_space(s[i]) || s[i] == '>' || s[i] == '/');
}

std::size_t tag_end(std::string_view s, std::size_t lt)
{
    std::size_t gt = s.find('>', lt);
    return gt == npos ? npos : gt + 1;
}

std::size_t find_tag(std::string_view s, std::size_t from, std::string_view name, bool closing)
{
    std::size_t lt = s.find('<', from);
    while (lt != npos)
    {
        if (is_tag_named(s, lt, name, closing))
            return lt;
        lt = s.find('<', lt + 1);
    }
    return npos;
}

std::string_view tag_attributes(std::string_view s, std::size_t lt, std::size_t end, std::string_view name)
{
    std::size_t begin = lt + 1 + name.size();
    if (end == npos || end <= begin)
        return std::string_view();
    // end points one past '>'
    return s.substr(begin, end - 1 - begin);
}

std::optional<std::string> attribute_value(std::string_view attrs, std::string_view attribute)
{
    const std::string lower = to_lower_ascii(attrs);
    std::size_t pos = 0;
    while (pos < attrs.size())
    {
        std::size_t hit = lower.find(attribute, pos);
        if (hit == npos)
            break;
        pos = hit + attribute.size();

        if (hit > 0 && !is_space(attrs[hit - 1]))
            continue;

        std::size_t i = hit + attribute.size();
        while (i < attrs.size() && is_space(attrs[i]))
            ++i;
        if (i >= attrs.size() || attrs[i] != '=')
            continue;
        ++i;
        while (i < attrs.size() && is_space(attrs[i]))
            ++i;
        if (i >= attrs.size())
            return std::string();

        char quote = attrs[i];
        if (quote == '"' || quote == '\'')
        {
            std::size_t end = attrs.find(quote, i + 1);
            if (end == npos)
                end = attrs.size();
            return std::string(attrs.substr(i + 1, end - i - 1));
        }

        std::size_t end = i;
        while (end < attrs.size() && !is_space(attrs[end]))
            ++end;
        return std::string(attrs.substr(i, end - i));
    }
    return std::nullopt;
}

} // namespace processing::markup
