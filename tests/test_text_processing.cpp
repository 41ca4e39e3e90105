#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "processing/Diagnostics.hpp"
#include "processing/TextNormalizer.hpp"
#include "processing/TextUtils.hpp"

using namespace processing;

TEST_CASE("normalize_line_endings converts CRLF and lone CR", "[text_processing]")
{
    REQUIRE(normalize_line_endings("a\r\nb\rc\n") == "a\nb\nc\n");
    REQUIRE(normalize_line_endings("plain") == "plain");
}

TEST_CASE("split_lines does not add a trailing empty line", "[text_processing]")
{
    REQUIRE(split_lines("").empty());
    REQUIRE(split_lines("a\nb\n") == std::vector<std::string>{ "a", "b" });
    REQUIRE(split_lines("a\n\nb") == std::vector<std::string>{ "a", "", "b" });
    REQUIRE(join_lines({ "a", "", "b" }) == "a\n\nb");
}

TEST_CASE("collapse_blank_lines trims lines and keeps one blank line", "[text_processing]")
{
    REQUIRE(collapse_blank_lines("\n\n  first  \n\n\n\n second\n   \n") == "first\n\nsecond");
    REQUIRE(collapse_blank_lines("") == "");
    REQUIRE(collapse_blank_lines("   \n \n") == "");
}

TEST_CASE("count_words treats Unicode spaces as separators", "[text_processing]")
{
    REQUIRE(count_words("") == 0);
    REQUIRE(count_words("  one two\tthree\n") == 3);
    // U+00A0 NO-BREAK SPACE and U+3000 IDEOGRAPHIC SPACE
    REQUIRE(count_words("one\xC2\xA0two\xE3\x80\x80three") == 3);
    // Invalid bytes are word content
    REQUIRE(count_words("\xFF\xFE") == 1);
}

TEST_CASE("trim_unicode and collapse_whitespace handle non-breaking spaces", "[text_processing]")
{
    REQUIRE(trim_unicode("\xC2\xA0 hello world \xC2\xA0") == "hello world");
    REQUIRE(trim_unicode(" \t\n") == "");
    REQUIRE(collapse_whitespace("  Wednesday,\n  May   21st\xC2\xA0 2025 ") == "Wednesday, May 21st 2025");
}

TEST_CASE("isUnicodeSpace covers separators and ASCII controls", "[text_processing]")
{
    REQUIRE(isUnicodeSpace(U' '));
    REQUIRE(isUnicodeSpace(U'\r'));
    REQUIRE(isUnicodeSpace(0x2028));
    REQUIRE(isUnicodeSpace(0x0085));
    REQUIRE_FALSE(isUnicodeSpace(U'a'));
    REQUIRE_FALSE(isUnicodeSpace(0x3042));
}

TEST_CASE("Diagnostics preview escapes control characters and respects UTF-8", "[text_processing]")
{
    std::size_t saved = Diagnostics::MaxPreview();

    Diagnostics::SetMaxPreview(5);
    std::string preview = Diagnostics::Preview("ab\xE3\x81\x82\xE3\x81\x84");
    // Cut before the second three-byte sequence
    REQUIRE(preview.find("\xE3\x81\x84") == std::string::npos);
    REQUIRE(preview.find("ab\xE3\x81\x82") == 0);

    Diagnostics::SetMaxPreview(200);
    REQUIRE(Diagnostics::Preview("a\nb").find('\n') == std::string::npos);
    REQUIRE(Diagnostics::EpisodeTag("IM", 801) == "IM#801");

    Diagnostics::SetMaxPreview(saved);
}
