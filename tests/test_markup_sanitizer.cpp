#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <vector>

#include "processing/MarkupSanitizer.hpp"

using processing::MarkupSanitizer;

TEST_CASE("MarkupSanitizer maps structural tags to Markdown", "[markup_sanitizer]")
{
    MarkupSanitizer s;

    REQUIRE(s.sanitize("<h1>Title</h1><h2>Sub</h2><h3>Minor</h3>") == "# Title\n\n## Sub\n\n### Minor");
    REQUIRE(s.sanitize("<p>Hello <b>World</b></p><p>Again <i>soft</i></p>") == "Hello **World**\n\nAgain *soft*");
    REQUIRE(s.sanitize("<p><strong>Strong</strong> and <em>em</em></p>") == "**Strong** and *em*");
    REQUIRE(s.sanitize("Line1<br>Line2<br/>Line3<BR />Line4") == "Line1\nLine2\nLine3\nLine4");
    REQUIRE(s.sanitize("<ul><li>One</li><li>Two</li></ul>") == "* One\n* Two");
}

TEST_CASE("MarkupSanitizer matches tag names whole and case-insensitively", "[markup_sanitizer]")
{
    MarkupSanitizer s;

    REQUIRE(s.sanitize("<B>Bold</B>") == "**Bold**");
    REQUIRE(s.sanitize("<blockquote>Quote</blockquote>") == "Quote");
    REQUIRE(s.sanitize("<body><p>Text</p></body>") == "Text");
    REQUIRE(s.sanitize("<span class=\"x\">Inline</span> <font size=2>tags</font>") == "Inline tags");
}

TEST_CASE("MarkupSanitizer drops script and style blocks with their content", "[markup_sanitizer]")
{
    MarkupSanitizer s;
    std::string out = s.sanitize("<script type=\"text/javascript\">var x = '<p>no</p>';</script>"
                                 "<style>p { color: red; }</style><p>Visible</p>");
    REQUIRE(out == "Visible");
}

TEST_CASE("MarkupSanitizer keeps link targets only for safe schemes", "[markup_sanitizer]")
{
    MarkupSanitizer s;

    REQUIRE(s.sanitize("<a href=\"https://twit.tv/im\">Show</a>") == "[Show](https://twit.tv/im)");
    REQUIRE(s.sanitize("<a href='/shows/im'>Relative</a>") == "[Relative](/shows/im)");
    REQUIRE(s.sanitize("<a class=\"x\" href=http://example.com>Bare</a>") == "[Bare](http://example.com)");

    std::vector<std::string> unsafe = { "<a href=\"javascript:alert(1)\">Click</a>",
                                        "<a href=\"data:text/html;base64,AAAA\">Click</a>",
                                        "<a href=\"mailto:someone@example.com\">Click</a>",
                                        "<a name=\"anchor\">Click</a>" };
    for (const auto& html : unsafe)
    {
        std::string out = s.sanitize(html);
        REQUIRE(out == "Click");
        REQUIRE(out.find("javascript") == std::string::npos);
        REQUIRE(out.find("data:") == std::string::npos);
        REQUIRE(out.find("mailto") == std::string::npos);
    }
}

TEST_CASE("MarkupSanitizer decodes the fixed entity set only", "[markup_sanitizer]")
{
    MarkupSanitizer s;

    REQUIRE(s.sanitize("Tom &amp; Jerry &quot;cats&quot; &#39;n&#39; mice") == "Tom & Jerry \"cats\" 'n' mice");
    REQUIRE(s.sanitize("a&nbsp;b &copy; 2025") == "a b &copy; 2025");
    REQUIRE(s.sanitize("x &lt;3 y") == "x <3 y");
}

TEST_CASE("MarkupSanitizer keeps a literal '<' in prose", "[markup_sanitizer]")
{
    MarkupSanitizer s;
    REQUIRE(s.sanitize("1 < 2 and 3<4") == "1 < 2 and 3<4");
    REQUIRE(MarkupSanitizer::stripTags("a <!-- note --> b <?xml x?> c") == "a  b  c");
}

TEST_CASE("MarkupSanitizer collapses blank lines and trims", "[markup_sanitizer]")
{
    MarkupSanitizer s;
    REQUIRE(s.sanitize("\n\n<p>  One  </p>\n\n\n<p></p><p>Two</p>\n\n") == "One\n\nTwo");
    REQUIRE(s.sanitize("") == "");
    REQUIRE(s.sanitize("<div><span></span></div>") == "");
}

TEST_CASE("MarkupSanitizer output is a fixed point", "[markup_sanitizer]")
{
    MarkupSanitizer s;
    std::vector<std::string> inputs = {
        "<p>Hello <b>World</b></p>",
        "&amp;lt;b&amp;gt;bold&amp;lt;/b&amp;gt;",
        "&lt;p&gt;escaped paragraph&lt;/p&gt;",
        "<a href=\"https://x.y\">&lt;b&gt;x&lt;/b&gt;</a>",
        "<b>unclosed <i>nested</b> text",
        "<ul><li>a<li>b</ul>",
        "**already** *markdown*\n\n\n# heading",
        "<scr<script>ipt>alert(1)</script>",
        "1 < 2 > 0 &amp;&amp; x",
    };

    for (const auto& input : inputs)
    {
        std::string once = s.sanitize(input);
        REQUIRE(s.sanitize(once) == once);
    }
}

TEST_CASE("MarkupSanitizer treats escaped tags as markup once decoded", "[markup_sanitizer]")
{
    MarkupSanitizer s;
    std::string out = s.sanitize("<p>Steve: the &lt;script&gt;alert(1)&lt;/script&gt; payload</p>");
    REQUIRE(out.rfind("Steve: the", 0) == 0);
    REQUIRE(out.find("payload") != std::string::npos);
    REQUIRE(out.find("script") == std::string::npos);
    REQUIRE(out.find("alert") == std::string::npos);

    REQUIRE(s.sanitize("&lt;b&gt;loud&lt;/b&gt;") == "**loud**");
    REQUIRE(s.sanitize(out) == out);
}

TEST_CASE("isSafeLinkTarget accepts only root-relative and http(s) targets", "[markup_sanitizer]")
{
    REQUIRE(MarkupSanitizer::isSafeLinkTarget("/path"));
    REQUIRE(MarkupSanitizer::isSafeLinkTarget("http://a"));
    REQUIRE(MarkupSanitizer::isSafeLinkTarget("https://a"));
    REQUIRE_FALSE(MarkupSanitizer::isSafeLinkTarget("javascript:x"));
    REQUIRE_FALSE(MarkupSanitizer::isSafeLinkTarget("ftp://a"));
    REQUIRE_FALSE(MarkupSanitizer::isSafeLinkTarget(""));
}

TEST_CASE("MarkupSanitizer handles unclosed tags in linear time", "[markup_sanitizer]")
{
    MarkupSanitizer s;
    REQUIRE(s.sanitize("<p>one<li>two<a href=\"/x\">three<b>four") == "onetwothreefour");

    std::string page;
    for (int i = 0; i < 32000; ++i)
        page += "<p>Line " + std::to_string(i) + " <li>item <a href=\"/x\">link ";

    auto start = std::chrono::steady_clock::now();
    std::string out = s.sanitize(page);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(out.find('<') == std::string::npos);
    REQUIRE(out.rfind("Line 0 item link Line 1", 0) == 0);
    REQUIRE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() < 2000);

    std::string unterminated;
    for (int i = 0; i < 32000; ++i)
        unterminated += "x <!-- y <b z ";
    start = std::chrono::steady_clock::now();
    out = s.sanitize(unterminated);
    elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(out == unterminated.substr(0, unterminated.size() - 1));
    REQUIRE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() < 2000);
}
