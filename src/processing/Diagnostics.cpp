#include "Diagnostics.hpp"

#include <algorithm>

namespace processing
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

namespace
{

bool isContinuationByte(unsigned char c) { return (c & 0xC0) == 0x80; }

} // anonymous namespace

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    if (bytes == 0)
        bytes = 1;
    max_preview_.store(bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    std::size_t cut = std::min(text.size(), MaxPreview());
    while (cut > 0 && cut < text.size() && isContinuationByte(static_cast<unsigned char>(text[cut])))
        --cut;

    std::string out;
    out.reserve(cut + 24);
    for (std::size_t i = 0; i < cut; ++i)
    {
        switch (text[i])
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(text[i]);
            break;
        }
    }

    if (cut < text.size())
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    replaceControlChars(out);
    return out;
}

std::string Diagnostics::EpisodeTag(std::string_view prefix, int episode_number)
{
    std::string tag(prefix.empty() ? std::string_view("?") : prefix);
    tag += '#';
    tag += std::to_string(episode_number);
    return tag;
}

void Diagnostics::replaceControlChars(std::string& text)
{
    auto is_control = [](unsigned char c)
    {
        return c < 0x20 || c == 0x7F;
    };
    std::replace_if(text.begin(), text.end(), is_control, '?');
}

} // namespace processing
