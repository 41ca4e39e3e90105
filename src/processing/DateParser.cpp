#include "DateParser.hpp"
#include "TextUtils.hpp"

#include <array>
#include <cstdio>
#include <regex>

namespace processing
{

namespace
{

constexpr std::array<const char*, 12> kMonthNames = { "January", "February", "March",     "April",   "May",      "June",
                                                      "July",    "August",   "September", "October", "November", "December" };

constexpr std::size_t kIntroSearchBytes = 30000;
constexpr std::size_t kAnyDateSearchBytes = 10000;
constexpr std::size_t kDateWindowBytes = 80;

bool isLeapYear(int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

bool isValidDate(int year, int month, int day)
{
    static constexpr std::array<int, 12> kDays = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (year < 1 || month < 1 || month > 12 || day < 1)
        return false;
    int limit = kDays[static_cast<std::size_t>(month - 1)];
    if (month == 2 && isLeapYear(year))
        limit = 29;
    return day <= limit;
}

std::string formatKey(int year, int month, int day)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d-%02d-%02d", year % 100, month, day);
    return buf;
}

std::string formatLong(int year, int month, int day)
{
    return std::string(kMonthNames[static_cast<std::size_t>(month - 1)]) + " " + std::to_string(day) + ", " +
           std::to_string(year);
}

// Full month names only; avoids taking words like "Mar" or "Jun" out of prose
int fullMonthIndex(std::string_view name)
{
    std::string lower = to_lower_ascii(name);
    for (std::size_t i = 0; i < kMonthNames.size(); ++i)
    {
        if (lower == to_lower_ascii(kMonthNames[i]))
            return static_cast<int>(i + 1);
    }
    return 0;
}

// "Tuesday, February 5th, 2019" or "February 5, 2019" at the start of the window
std::optional<std::string> matchDateAt(std::string_view text, std::size_t pos)
{
    static const std::regex kDateHead(
        R"(^\W*(?:[A-Za-z]+\W+)?([A-Za-z]+)\W+(\d{1,2})(?:st|nd|rd|th)?\W+(\d{4}))");

    if (pos >= text.size())
        return std::nullopt;
    std::string window(text.substr(pos, kDateWindowBytes));
    std::smatch m;
    if (!std::regex_search(window, m, kDateHead, std::regex_constants::match_continuous))
        return std::nullopt;

    int month = month_from_name(m[1].str());
    int day = std::stoi(m[2].str());
    int year = std::stoi(m[3].str());
    if (month == 0 || !isValidDate(year, month, day))
        return std::nullopt;
    return formatLong(year, month, day);
}

std::optional<std::string> findIntroDate(std::string_view text)
{
    const std::string lower = to_lower_ascii(text.substr(0, kIntroSearchBytes));

    std::size_t anchor = std::min(lower.find("security now!"), lower.find("episode"));
    if (anchor == std::string::npos)
        return std::nullopt;

    for (std::string_view keyword : { std::string_view("recorded"), std::string_view(" for ") })
    {
        std::size_t hit = lower.find(keyword, anchor);
        while (hit != std::string::npos)
        {
            if (auto date = matchDateAt(text, hit + keyword.size()))
                return date;
            hit = lower.find(keyword, hit + 1);
        }
    }
    return std::nullopt;
}

std::optional<std::string> findLastEditDate(std::string_view text)
{
    static const std::regex kLastEdit(R"(^\s*([A-Za-z]+)\.?\s+(\d{1,2}),?\s+(\d{4}))");

    const std::string lower = to_lower_ascii(text);
    std::size_t hit = lower.find("last edit:");
    if (hit == std::string::npos)
        return std::nullopt;

    std::string window(text.substr(hit + 10, kDateWindowBytes));
    std::smatch m;
    if (!std::regex_search(window, m, kLastEdit, std::regex_constants::match_continuous))
        return std::nullopt;

    int month = month_from_name(m[1].str());
    int day = std::stoi(m[2].str());
    int year = std::stoi(m[3].str());
    if (month == 0 || !isValidDate(year, month, day))
        return std::nullopt;
    return formatLong(year, month, day);
}

std::optional<std::string> findFirstLongDate(std::string_view text)
{
    static const std::regex kLongDate(R"(([A-Za-z]+)\s+(\d{1,2})(?:st|nd|rd|th)?,?\s+(\d{4}))");

    const std::string head(text.substr(0, kAnyDateSearchBytes));
    for (std::sregex_iterator it(head.begin(), head.end(), kLongDate), end; it != end; ++it)
    {
        const auto& m = *it;
        int month = fullMonthIndex(m[1].str());
        int day = std::stoi(m[2].str());
        int year = std::stoi(m[3].str());
        if (month != 0 && isValidDate(year, month, day))
            return formatLong(year, month, day);
    }
    return std::nullopt;
}

} // anonymous namespace

int month_from_name(std::string_view name)
{
    std::string lower = to_lower_ascii(name);
    if (lower == "sept")
        return 9;
    for (std::size_t i = 0; i < kMonthNames.size(); ++i)
    {
        std::string full = to_lower_ascii(kMonthNames[i]);
        if (lower == full || (lower.size() == 3 && full.compare(0, 3, lower) == 0))
            return static_cast<int>(i + 1);
    }
    return 0;
}

std::optional<std::string> parse_date_key(std::string_view date_text)
{
    if (date_text.empty() || date_text == kUnknownDate)
        return std::nullopt;

    static const std::regex kMonthDayYear(R"(([A-Za-z]+)\.?\s+(\d{1,2})(?:st|nd|rd|th)?,?\s+(\d{4}))");
    static const std::regex kIsoDate(R"((\d{4})-(\d{1,2})-(\d{1,2}))");

    const std::string text(date_text);
    for (std::sregex_iterator it(text.begin(), text.end(), kMonthDayYear), end; it != end; ++it)
    {
        const auto& m = *it;
        int month = month_from_name(m[1].str());
        int day = std::stoi(m[2].str());
        int year = std::stoi(m[3].str());
        if (month != 0 && isValidDate(year, month, day))
            return formatKey(year, month, day);
    }

    for (std::sregex_iterator it(text.begin(), text.end(), kIsoDate), end; it != end; ++it)
    {
        const auto& m = *it;
        int year = std::stoi(m[1].str());
        int month = std::stoi(m[2].str());
        int day = std::stoi(m[3].str());
        if (isValidDate(year, month, day))
            return formatKey(year, month, day);
    }

    return std::nullopt;
}

std::string date_key_or_default(std::string_view date_text)
{
    return parse_date_key(date_text).value_or(kUnknownDateKey);
}

int extract_year(std::string_view date_text)
{
    for (std::size_t i = 0; i + 4 <= date_text.size(); ++i)
    {
        bool four_digits = true;
        for (std::size_t j = 0; j < 4; ++j)
        {
            char c = date_text[i + j];
            if (c < '0' || c > '9')
            {
                four_digits = false;
                break;
            }
        }
        if (four_digits)
            return std::stoi(std::string(date_text.substr(i, 4)));
    }
    return 0;
}

std::optional<std::string> infer_date_from_text(std::string_view text)
{
    if (text.empty())
        return std::nullopt;

    if (auto date = findIntroDate(text))
        return date;
    if (auto date = findLastEditDate(text))
        return date;
    return findFirstLongDate(text);
}

} // namespace processing
