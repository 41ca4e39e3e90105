#include <catch2/catch_test_macros.hpp>
#include <string>

#include "processing/BodyRepair.hpp"

using namespace processing;

TEST_CASE("strip_masthead drops navigation before the episode heading", "[body_repair]")
{
    std::string html = "<nav>Home | Shows</nav><font size=2><b>Transcript of Episode #13</b></font><p>Hi</p>";
    std::string out = strip_masthead(html);
    REQUIRE(out.rfind("Transcript of Episode #13", 0) == 0);
    REQUIRE(out.find("Home") == std::string::npos);
    REQUIRE(out.find("<p>Hi</p>") != std::string::npos);
}

TEST_CASE("strip_masthead leaves documents without the heading alone", "[body_repair]")
{
    REQUIRE(strip_masthead("<p>No heading</p>") == "<p>No heading</p>");
    REQUIRE(strip_masthead("Transcript of Episode #abc") == "Transcript of Episode #abc");
    REQUIRE(strip_masthead("") == "");
}

TEST_CASE("strip_disclaimer removes the whole AI boilerplate paragraph", "[body_repair]")
{
    std::string text = "Intro\n\n"
                       "Please be advised this transcript is AI-generated and may not be word for word. "
                       "Time codes refer to the approximate times in the ad-supported version of the show.\n\n"
                       "Leo: Hi";
    REQUIRE(strip_disclaimer(text) == "Intro\n\nLeo: Hi");
}

TEST_CASE("strip_disclaimer handles emphasis and case", "[body_repair]")
{
    REQUIRE(strip_disclaimer("*please be advised this transcript is ai-generated and may not be Word For Word.*") ==
            "");
    REQUIRE(strip_disclaimer("A\n*Please be advised this transcript is AI-generated and may not be word for word.*\nB") ==
            "A\n\nB");
}

TEST_CASE("strip_disclaimer keeps text without a closing phrase", "[body_repair]")
{
    std::string text = "Please be advised this transcript is AI-generated. Nothing else.";
    REQUIRE(strip_disclaimer(text) == text);
    REQUIRE(strip_disclaimer("Ordinary text") == "Ordinary text");
}
