#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

/// True for Unicode space separators (Zs, includes U+00A0) and TAB/LF/VT/FF/CR
bool isUnicodeSpace(char32_t cp);

/// Removes leading and trailing Unicode whitespace
std::string trim_unicode(std::string_view text);

/// Number of maximal runs of non-whitespace code points
std::size_t count_words(std::string_view text);

/// Replaces every whitespace run with one ASCII space and trims the result
std::string collapse_whitespace(std::string_view text);

/// ASCII case-insensitive prefix test
bool starts_with_icase(std::string_view text, std::string_view prefix);

/// ASCII lower-casing; other bytes unchanged
std::string to_lower_ascii(std::string_view text);

} // namespace processing
