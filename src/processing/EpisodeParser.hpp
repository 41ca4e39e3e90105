#pragma once

#include "TextPipeline.hpp"
#include "TextProcessingTypes.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace processing
{

struct ParserOptions
{
    bool infer_date_from_body = true;
    PipelineOptions pipeline;
};

// Turns one episode document into metadata plus a standardized body.
//
// Title comes from <h1 class="post-title">, the date text from <p class="byline">
// and the body from <div class="body textual">; any of them may be missing, in
// which case the documented defaults are used. Nothing in here throws on malformed
// markup.
class EpisodeParser
{
public:
    explicit EpisodeParser(ParserOptions options = {});

    [[nodiscard]] text_processing::EpisodeMetadata extractMetadata(const text_processing::RawDocument& doc) const;

    [[nodiscard]] text_processing::NormalizedEpisode parse(const text_processing::RawDocument& doc) const;

    // "# Episode: <title>\n**Date:** <date>\n\n<body>\n\n---\n\n" with word and byte counts
    [[nodiscard]] static text_processing::RenderedEpisode render(const text_processing::NormalizedEpisode& episode);

    // "IM_801.html" -> 801, 0 when the name carries no "_<n>.html"
    [[nodiscard]] static int episode_number_from_filename(std::string_view filename);

    // "Episode 12", "Ep. 12" or "#12" inside a title, 0 otherwise
    [[nodiscard]] static int episode_number_from_title(std::string_view title);

    // Inner markup of the first <tag class="css_class"> element, nested same-name
    // elements balanced. An unclosed element runs to the end of the document.
    [[nodiscard]] static std::optional<std::string> extract_element(const std::string& html, std::string_view tag,
                                                                    std::string_view css_class);

private:
    ParserOptions options_;
    TextPipeline pipeline_;
};

} // namespace processing
