#pragma once

#include <string>
#include <vector>

namespace processing
{

// Converts \r\n and \r to \n
[[nodiscard]] std::string normalize_line_endings(const std::string& text);

// Splits on '\n'; a trailing newline does not produce an extra empty line
[[nodiscard]] std::vector<std::string> split_lines(const std::string& text);

[[nodiscard]] std::string join_lines(const std::vector<std::string>& lines);

// Trims every line, drops leading blank lines and keeps at most one blank line between
// non-blank ones. Trailing blank lines are dropped as well.
[[nodiscard]] std::vector<std::string> compact_lines(const std::vector<std::string>& lines);

// normalize_line_endings + split + compact + join
[[nodiscard]] std::string collapse_blank_lines(const std::string& text);

} // namespace processing
