#pragma once

#include "ITimestampMatcher.hpp"
#include "TextProcessingTypes.hpp"

#include <memory>
#include <string>
#include <vector>

namespace processing
{

// Rewrites utterance-starting lines into the canonical tag
//   EP:<n> Date:<YY-MM-DD> TS:<timestamp> - [<speaker> ]<text>
// and folds a marker line's continuation into it.
//
// The scan is index based with one line of lookahead: a marker with no trailing text
// consumes the next line when that line is non-empty and does not look like a marker
// itself. Unmatched lines and blank separators pass through unchanged.
class TimestampStandardizer
{
public:
    TimestampStandardizer();
    explicit TimestampStandardizer(std::vector<std::unique_ptr<ITimestampMatcher>> cascade);
    ~TimestampStandardizer();

    TimestampStandardizer(const TimestampStandardizer&) = delete;
    TimestampStandardizer& operator=(const TimestampStandardizer&) = delete;

    // First matching shape in cascade order
    [[nodiscard]] text_processing::MatchResult classify(const std::string& line) const;

    [[nodiscard]] std::vector<std::string> standardize(const std::vector<std::string>& lines, int episode_number,
                                                       const std::string& date_key) const;

    // Splits on '\n', standardizes and joins; surrounding whitespace is trimmed
    [[nodiscard]] std::string standardizeText(const std::string& text, int episode_number,
                                              const std::string& date_key) const;

    [[nodiscard]] static std::string renderPrefix(int episode_number, const std::string& date_key,
                                                  const text_processing::NormalizedLine& line);

    [[nodiscard]] static std::string render(int episode_number, const std::string& date_key,
                                            const text_processing::NormalizedLine& line);

private:
    std::vector<std::unique_ptr<ITimestampMatcher>> cascade_;
};

} // namespace processing
