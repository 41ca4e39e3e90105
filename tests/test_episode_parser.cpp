#include <catch2/catch_test_macros.hpp>
#include <string>

#include "processing/EpisodeParser.hpp"
#include "processing/TextUtils.hpp"

using namespace processing;
using text_processing::RawDocument;

namespace
{

const char* kEpisodeHtml = R"(<html><body>
<h1 class="post-title">Intelligent Machines 801: Robots &amp; Us</h1>
<p class="byline">
   Wednesday, May 21st
   2025
</p>
<div class="body textual">
<p>Please be advised this transcript is AI-generated and may not be word for word. Time codes refer to the approximate times in the ad-supported version of the show.</p>
<p>0:00:52 - Leo Laporte<br>Hello <b>everybody</b>.</p>
<div class="note"><p>Nested div content</p></div>
<p>Paris Martineau [0:01:10]: Hi Leo.</p>
</div>
<div class="footer">Footer junk</div>
</body></html>)";

RawDocument makeDoc(std::string markup, std::string path = "data/IM_801.html")
{
    RawDocument doc;
    doc.markup = std::move(markup);
    doc.prefix = "IM";
    doc.source_path = std::move(path);
    return doc;
}

} // namespace

TEST_CASE("EpisodeParser extracts metadata from a well-formed document", "[episode_parser]")
{
    EpisodeParser parser;
    auto meta = parser.extractMetadata(makeDoc(kEpisodeHtml));

    REQUIRE(meta.episode_number == 801);
    REQUIRE(meta.title == "Intelligent Machines 801: Robots & Us");
    REQUIRE(meta.date_text == "Wednesday, May 21st 2025");
    REQUIRE(meta.date_key == "25-05-21");
    REQUIRE(meta.year == 2025);
}

TEST_CASE("EpisodeParser produces a standardized body", "[episode_parser]")
{
    EpisodeParser parser;
    auto episode = parser.parse(makeDoc(kEpisodeHtml));

    REQUIRE(episode.body.rfind("EP:801 Date:25-05-21 TS:0:00:52 - Leo Laporte Hello **everybody**.", 0) == 0);
    REQUIRE(episode.body.find("EP:801 Date:25-05-21 TS:0:01:10 - Paris Martineau Hi Leo.") != std::string::npos);
    REQUIRE(episode.body.find("Nested div content") != std::string::npos);
    REQUIRE(episode.body.find("Footer junk") == std::string::npos);
    REQUIRE(episode.body.find("AI-generated") == std::string::npos);
    REQUIRE(episode.body.find('<') == std::string::npos);
}

TEST_CASE("EpisodeParser render builds the episode block and counts", "[episode_parser]")
{
    EpisodeParser parser;
    auto episode = parser.parse(makeDoc(kEpisodeHtml));
    auto rendered = EpisodeParser::render(episode);

    std::string head = "# Episode: Intelligent Machines 801: Robots & Us\n**Date:** Wednesday, May 21st 2025\n\n";
    REQUIRE(rendered.block.rfind(head, 0) == 0);
    REQUIRE(rendered.block.size() >= 7);
    REQUIRE(rendered.block.substr(rendered.block.size() - 7) == "\n\n---\n\n");
    REQUIRE(rendered.block == head + episode.body + "\n\n---\n\n");
    REQUIRE(rendered.bytes == rendered.block.size());
    REQUIRE(rendered.words == count_words(episode.body));
    REQUIRE(rendered.episode_number == 801);
    REQUIRE(rendered.year == 2025);
}

TEST_CASE("EpisodeParser falls back to defaults on malformed input", "[episode_parser]")
{
    EpisodeParser parser;
    auto episode = parser.parse(makeDoc("garbage <<< <div class=", ""));

    REQUIRE(episode.metadata.episode_number == 0);
    REQUIRE(episode.metadata.title == "Unknown Episode");
    REQUIRE(episode.metadata.date_text == "Unknown Date");
    REQUIRE(episode.metadata.date_key == "00-01-01");
    REQUIRE(episode.metadata.year == 0);
    REQUIRE(episode.body.empty());

    auto rendered = EpisodeParser::render(episode);
    REQUIRE(rendered.block == "# Episode: Unknown Episode\n**Date:** Unknown Date\n\n\n\n---\n\n");
    REQUIRE(rendered.words == 0);
}

TEST_CASE("EpisodeParser infers the date from the body when the byline has none", "[episode_parser]")
{
    std::string html = "<h1 class=\"post-title\">Security Now! Episode 700</h1>"
                       "<div class=\"body textual\"><p>Security Now! Episode 700 recorded Tuesday, "
                       "February 5th, 2019</p><p>(0:01): Hi</p></div>";

    SECTION("inference enabled")
    {
        EpisodeParser parser;
        auto meta = parser.extractMetadata(makeDoc(html, ""));
        REQUIRE(meta.episode_number == 700);
        REQUIRE(meta.date_text == "February 5, 2019");
        REQUIRE(meta.date_key == "19-02-05");
        REQUIRE(meta.year == 2019);
    }

    SECTION("inference disabled")
    {
        ParserOptions options;
        options.infer_date_from_body = false;
        EpisodeParser parser(options);
        auto meta = parser.extractMetadata(makeDoc(html, ""));
        REQUIRE(meta.date_text == "Unknown Date");
        REQUIRE(meta.date_key == "00-01-01");
        REQUIRE(meta.year == 0);
    }
}

TEST_CASE("extract_element balances nested elements and matches classes", "[episode_parser]")
{
    REQUIRE(EpisodeParser::extract_element("<div class='body  textual'>a<div>b</div>c</div>d", "div", "body textual") ==
            "a<div>b</div>c");
    REQUIRE(EpisodeParser::extract_element("<div class=\"body textual\">unclosed", "div", "body textual") ==
            "unclosed");
    REQUIRE_FALSE(EpisodeParser::extract_element("<div class=\"other\">x</div>", "div", "body textual").has_value());
    REQUIRE(EpisodeParser::extract_element("<P CLASS=\"byline\">May 1 2020</P>", "p", "byline") == "May 1 2020");
}

TEST_CASE("Episode numbers come from the file name or the title", "[episode_parser]")
{
    REQUIRE(EpisodeParser::episode_number_from_filename("IM_801.html") == 801);
    REQUIRE(EpisodeParser::episode_number_from_filename("/data/TWIG_12.html") == 12);
    REQUIRE(EpisodeParser::episode_number_from_filename("notes.html") == 0);
    REQUIRE(EpisodeParser::episode_number_from_filename("IM_abc.html") == 0);

    REQUIRE(EpisodeParser::episode_number_from_title("Security Now! Episode 700") == 700);
    REQUIRE(EpisodeParser::episode_number_from_title("TWiT #1000: Party") == 1000);
    REQUIRE(EpisodeParser::episode_number_from_title("Ep. 5 - Pilot") == 5);
    REQUIRE(EpisodeParser::episode_number_from_title("Untitled") == 0);
}
