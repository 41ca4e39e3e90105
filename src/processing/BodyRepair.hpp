#pragma once

#include <string>

namespace processing
{

// Drops site navigation and masthead markup in front of "Transcript of Episode #<n>".
// Markup without that heading is returned unchanged.
[[nodiscard]] std::string strip_masthead(const std::string& markup);

// Removes the "Please be advised this transcript is AI-generated ..." boilerplate from
// sanitized text. The removal ends at the last closing phrase ("word for word",
// "approximate times", "ad-supported version of the show") on the disclaimer's line,
// or at the first one found further on when the line has none.
[[nodiscard]] std::string strip_disclaimer(const std::string& text);

} // namespace processing
