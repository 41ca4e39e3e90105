#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Find-based tag scanning shared by the sanitizer and the episode parser.
// Tag names match whole names only and ASCII case-insensitively.
namespace processing::markup
{

constexpr std::size_t npos = std::string::npos;

bool is_space(char c) noexcept;
bool is_ascii_alpha(char c) noexcept;

// True when s[lt] starts "<name" (or "</name" when closing) followed by whitespace, '>' or '/'
bool is_tag_named(std::string_view s, std::size_t lt, std::string_view name, bool closing);

// Index one past the '>' closing the tag that starts at lt, or npos
std::size_t tag_end(std::string_view s, std::size_t lt);

// First "<name" / "</name" at or after from, or npos
std::size_t find_tag(std::string_view s, std::size_t from, std::string_view name, bool closing);

// Attribute text of the opening tag [lt, end): everything between the name and '>'
std::string_view tag_attributes(std::string_view s, std::size_t lt, std::size_t end, std::string_view name);

// Value of an attribute (double-quoted, single-quoted or bare); nullopt when absent
std::optional<std::string> attribute_value(std::string_view attrs, std::string_view attribute);

} // namespace processing::markup
