#include "TextNormalizer.hpp"
#include "TextUtils.hpp"

namespace processing
{

std::string normalize_line_endings(const std::string& text)
{
    if (text.find('\r') == std::string::npos)
        return text;

    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\r')
        {
            // "\r\n" and lone '\r' both become a single '\n'
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            out.push_back('\n');
        }
        else
        {
            out.push_back(c);
        }
    }

    return out;
}

std::vector<std::string> split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    if (text.empty())
        return lines;

    size_t start = 0;
    while (start <= text.size())
    {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos)
        {
            if (start < text.size())
                lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines)
{
    std::string out;
    size_t total = 0;
    for (const auto& line : lines)
        total += line.size() + 1;
    out.reserve(total);

    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            out.push_back('\n');
        out += lines[i];
    }
    return out;
}

std::vector<std::string> compact_lines(const std::vector<std::string>& lines)
{
    std::vector<std::string> out;
    out.reserve(lines.size());

    for (const auto& raw : lines)
    {
        std::string line = trim_unicode(raw);
        if (!line.empty())
        {
            out.push_back(std::move(line));
        }
        else if (!out.empty() && !out.back().empty())
        {
            out.emplace_back();
        }
    }

    while (!out.empty() && out.back().empty())
        out.pop_back();

    return out;
}

std::string collapse_blank_lines(const std::string& text)
{
    if (text.empty())
        return text;
    return join_lines(compact_lines(split_lines(normalize_line_endings(text))));
}

} // namespace processing
