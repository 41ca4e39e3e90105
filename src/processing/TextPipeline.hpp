#pragma once

#include <memory>
#include <string>

namespace processing
{

class MarkupSanitizer;
class TimestampStandardizer;

struct PipelineOptions
{
    bool strip_masthead = true;
    bool strip_disclaimer = true;
};

// Body markup -> standardized transcript text.
// Stages: masthead -> sanitize -> disclaimer -> standardize. A failing stage is logged
// and the last good output is carried forward.
class TextPipeline
{
public:
    explicit TextPipeline(PipelineOptions options = {});
    ~TextPipeline();

    TextPipeline(const TextPipeline&) = delete;
    TextPipeline& operator=(const TextPipeline&) = delete;

    [[nodiscard]] std::string process(const std::string& body_markup, int episode_number,
                                      const std::string& date_key) const;

    [[nodiscard]] const PipelineOptions& options() const noexcept;
    [[nodiscard]] const MarkupSanitizer& sanitizer() const noexcept;
    [[nodiscard]] const TimestampStandardizer& standardizer() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace processing
