#include <catch2/catch_test_macros.hpp>
#include <string>

#include "processing/TextPipeline.hpp"

using namespace processing;

namespace
{

const std::string kMarkup = "<nav>Home | Shows</nav><p>Transcript of Episode #13</p>"
                            "<p>Please be advised this transcript is AI-generated and may not be word for word.</p>"
                            "<p>(0:01): Welcome <b>back</b></p>";

} // namespace

TEST_CASE("TextPipeline runs every stage by default", "[text_pipeline]")
{
    TextPipeline pipeline;
    REQUIRE(pipeline.options().strip_masthead);
    REQUIRE(pipeline.options().strip_disclaimer);

    std::string out = pipeline.process(kMarkup, 13, "05-10-12");
    REQUIRE(out == "Transcript of Episode #13\n\nEP:13 Date:05-10-12 TS:0:01 - Welcome **back**");
}

TEST_CASE("TextPipeline keeps the masthead when asked", "[text_pipeline]")
{
    PipelineOptions options;
    options.strip_masthead = false;
    TextPipeline pipeline(options);

    std::string out = pipeline.process(kMarkup, 13, "05-10-12");
    REQUIRE(out.find("Home | Shows") != std::string::npos);
    REQUIRE(out.find("AI-generated") == std::string::npos);
}

TEST_CASE("TextPipeline keeps the disclaimer when asked", "[text_pipeline]")
{
    PipelineOptions options;
    options.strip_disclaimer = false;
    TextPipeline pipeline(options);

    std::string out = pipeline.process(kMarkup, 13, "05-10-12");
    REQUIRE(out.find("Please be advised this transcript is AI-generated") != std::string::npos);
    REQUIRE(out.find("Home") == std::string::npos);
    REQUIRE(out.find("EP:13 Date:05-10-12 TS:0:01 - Welcome **back**") != std::string::npos);
}

TEST_CASE("TextPipeline returns empty output for empty input", "[text_pipeline]")
{
    TextPipeline pipeline;
    REQUIRE(pipeline.process("", 1, "00-01-01").empty());
    REQUIRE(pipeline.process("<p> </p>", 1, "00-01-01").empty());
}

TEST_CASE("TextPipeline renders bold speaker labels without stray emphasis", "[text_pipeline]")
{
    TextPipeline pipeline;
    std::string out = pipeline.process("<p><strong>Leo Laporte [00:00:52]:</strong> Hello everybody</p>"
                                       "<p><b>Steve Gibson (0:01:10):</b> Hi Leo</p>",
                                       801, "25-05-21");
    REQUIRE(out == "EP:801 Date:25-05-21 TS:00:00:52 - Leo Laporte Hello everybody\n\n"
                   "EP:801 Date:25-05-21 TS:0:01:10 - Steve Gibson Hi Leo");
}
