#include "EpisodeParser.hpp"
#include "DateParser.hpp"
#include "Diagnostics.hpp"
#include "MarkupSanitizer.hpp"
#include "MarkupScan.hpp"
#include "TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <regex>
#include <plog/Log.h>

namespace processing
{

using text_processing::EpisodeMetadata;
using text_processing::NormalizedEpisode;
using text_processing::RawDocument;
using text_processing::RenderedEpisode;

namespace
{

constexpr std::size_t kMaxEpisodeDigits = 9;

int toEpisodeNumber(const std::string& digits)
{
    if (digits.empty() || digits.size() > kMaxEpisodeDigits)
        return 0;
    return std::stoi(digits);
}

// Element text with tags removed, entities decoded and whitespace runs collapsed
std::string elementText(const std::string& inner)
{
    return collapse_whitespace(MarkupSanitizer::decodeEntities(MarkupSanitizer::stripTags(inner)));
}

} // anonymous namespace

EpisodeParser::EpisodeParser(ParserOptions options)
    : options_(options)
    , pipeline_(options.pipeline)
{
}

int EpisodeParser::episode_number_from_filename(std::string_view filename)
{
    static const std::regex kFileEpisode(R"(_(\d+)\.html)");

    const std::string name(filename);
    std::smatch m;
    if (!std::regex_search(name, m, kFileEpisode))
        return 0;
    return toEpisodeNumber(m[1].str());
}

int EpisodeParser::episode_number_from_title(std::string_view title)
{
    static const std::regex kTitleEpisode(R"((?:episode|ep\.?|#)\s*(\d+))", std::regex::icase);

    const std::string text(title);
    std::smatch m;
    if (!std::regex_search(text, m, kTitleEpisode))
        return 0;
    return toEpisodeNumber(m[1].str());
}

std::optional<std::string> EpisodeParser::extract_element(const std::string& html, std::string_view tag,
                                                         std::string_view css_class)
{
    using markup::find_tag;
    using markup::npos;

    std::size_t lt = find_tag(html, 0, tag, false);
    while (lt != npos)
    {
        std::size_t open_end = markup::tag_end(html, lt);
        if (open_end == npos)
            return std::nullopt;

        auto cls = markup::attribute_value(markup::tag_attributes(html, lt, open_end, tag), "class");
        if (cls && collapse_whitespace(*cls) == css_class)
        {
            int depth = 1;
            std::size_t pos = open_end;
            for (;;)
            {
                std::size_t next_close = find_tag(html, pos, tag, true);
                if (next_close == npos)
                    return html.substr(open_end);

                std::size_t next_open = find_tag(html, pos, tag, false);
                if (next_open != npos && next_open < next_close)
                {
                    ++depth;
                    pos = next_open + 1;
                    continue;
                }
                if (--depth == 0)
                    return html.substr(open_end, next_close - open_end);
                pos = next_close + 1;
            }
        }
        lt = find_tag(html, open_end, tag, false);
    }
    return std::nullopt;
}

EpisodeMetadata EpisodeParser::extractMetadata(const RawDocument& doc) const
{
    EpisodeMetadata meta;

    if (auto title = extract_element(doc.markup, "h1", "post-title"))
    {
        std::string text = elementText(*title);
        if (!text.empty())
            meta.title = std::move(text);
    }

    if (auto byline = extract_element(doc.markup, "p", "byline"))
    {
        std::string text = elementText(*byline);
        if (!text.empty())
            meta.date_text = std::move(text);
    }

    meta.episode_number = doc.episode_number;
    if (meta.episode_number == 0)
        meta.episode_number = episode_number_from_filename(doc.source_path);
    if (meta.episode_number == 0)
        meta.episode_number = episode_number_from_title(meta.title);

    std::optional<std::string> key = parse_date_key(meta.date_text);
    if (!key && options_.infer_date_from_body)
    {
        if (auto body = extract_element(doc.markup, "div", "body textual"))
        {
            if (auto inferred = infer_date_from_text(elementText(*body)))
            {
                PLOG_DEBUG << "Inferred date for " << Diagnostics::EpisodeTag(doc.prefix, meta.episode_number) << ": '"
                           << *inferred << "' (byline: '" << meta.date_text << "')";
                meta.date_text = *inferred;
                key = parse_date_key(meta.date_text);
            }
        }
    }

    meta.date_key = key.value_or(kUnknownDateKey);
    meta.year = extract_year(meta.date_text);
    return meta;
}

NormalizedEpisode EpisodeParser::parse(const RawDocument& doc) const
{
    PROFILE_SCOPE_FUNCTION();

    NormalizedEpisode episode;
    episode.metadata = extractMetadata(doc);

    std::optional<std::string> body = extract_element(doc.markup, "div", "body textual");
    if (!body)
    {
        PLOG_WARNING << Diagnostics::EpisodeTag(doc.prefix, episode.metadata.episode_number)
                     << " has no transcript body (" << doc.source_path << ")";
        return episode;
    }

    episode.body = pipeline_.process(*body, episode.metadata.episode_number, episode.metadata.date_key);

    if (Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance)
            << "[EpisodeParser] " << Diagnostics::EpisodeTag(doc.prefix, episode.metadata.episode_number)
            << " title=" << Diagnostics::Preview(episode.metadata.title) << " date=" << episode.metadata.date_key
            << " year=" << episode.metadata.year << " body_bytes=" << episode.body.size();
    }
    return episode;
}

RenderedEpisode EpisodeParser::render(const NormalizedEpisode& episode)
{
    RenderedEpisode rendered;
    rendered.episode_number = episode.metadata.episode_number;
    rendered.year = episode.metadata.year;

    rendered.block.reserve(episode.body.size() + episode.metadata.title.size() + 64);
    rendered.block += "# Episode: ";
    rendered.block += episode.metadata.title;
    rendered.block += "\n**Date:** ";
    rendered.block += episode.metadata.date_text;
    rendered.block += "\n\n";
    rendered.block += episode.body;
    rendered.block += "\n\n---\n\n";

    rendered.words = count_words(episode.body);
    rendered.bytes = rendered.block.size();
    return rendered;
}

} // namespace processing
