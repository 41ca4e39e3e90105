#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace processing
{

constexpr const char* kUnknownDate = "Unknown Date";
constexpr const char* kUnknownDateKey = "00-01-01";

// "May 21st 2025", "Wednesday, February 18, 2026", "Jan 1 2025", "2025-05-21" -> "YY-MM-DD".
// The first valid month/day/year found in the text wins; nullopt when none is found.
[[nodiscard]] std::optional<std::string> parse_date_key(std::string_view date_text);

// parse_date_key() or "00-01-01"
[[nodiscard]] std::string date_key_or_default(std::string_view date_text);

// First run of four digits, 0 when there is none
[[nodiscard]] int extract_year(std::string_view date_text);

// 1..12 for full names, three-letter abbreviations and "Sept" (any case), 0 otherwise
[[nodiscard]] int month_from_name(std::string_view name);

// Looks for a recording date inside transcript body text (tags already stripped):
// "Episode ... recorded Tuesday, February 5th, 2019" style intros first, then
// "Last Edit: Nov 14, 2005", then the earliest "Month d, yyyy" in the first 10000 bytes.
// Returns "Month d, yyyy".
[[nodiscard]] std::optional<std::string> infer_date_from_text(std::string_view text);

} // namespace processing
