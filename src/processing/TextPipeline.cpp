#include "TextPipeline.hpp"
#include "BodyRepair.hpp"
#include "Diagnostics.hpp"
#include "MarkupSanitizer.hpp"
#include "StageRunner.hpp"
#include "TimestampStandardizer.hpp"
#include "../utils/Profile.hpp"

#include <sstream>
#include <plog/Log.h>

namespace processing
{

namespace
{

void logInput(int episode_number, const std::string& input)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[TextPipeline] ep=" << episode_number << " stage=input bytes="
                                              << input.size() << " raw=" << Diagnostics::Preview(input);
}

void logStageResult(const text_processing::StageResult<std::string>& stage, const std::string& input)
{
    if (!Diagnostics::IsVerbose() && stage.succeeded)
        return;

    std::ostringstream oss;
    oss << "[TextPipeline] stage=" << stage.stage_name << " status=" << (stage.succeeded ? "ok" : "error")
        << " duration=" << stage.duration.count() << "us";
    if (stage.succeeded)
    {
        oss << " bytes=" << input.size() << "->" << stage.result.size()
            << " output=" << Diagnostics::Preview(stage.result);
        PLOG_INFO_(Diagnostics::kLogInstance) << oss.str();
    }
    else
    {
        oss << " input=" << Diagnostics::Preview(input) << " reason=" << (stage.error ? *stage.error : "unknown");
        PLOG_ERROR_(Diagnostics::kLogInstance) << oss.str();
    }
}

// Output of a stage, or its input when the stage failed
std::string carryForward(text_processing::StageResult<std::string>& stage, const std::string& input)
{
    logStageResult(stage, input);
    if (stage.succeeded)
        return std::move(stage.result);

    PLOG_WARNING_(Diagnostics::kLogInstance) << "[TextPipeline] fallback=" << stage.stage_name << "_input";
    return input;
}

} // anonymous namespace

struct TextPipeline::Impl
{
    explicit Impl(PipelineOptions opts)
        : options(opts)
    {
    }

    PipelineOptions options;
    MarkupSanitizer sanitizer;
    TimestampStandardizer standardizer;
};

TextPipeline::TextPipeline(PipelineOptions options)
    : impl_(std::make_unique<Impl>(options))
{
}

TextPipeline::~TextPipeline() = default;

const PipelineOptions& TextPipeline::options() const noexcept { return impl_->options; }

const MarkupSanitizer& TextPipeline::sanitizer() const noexcept { return impl_->sanitizer; }

const TimestampStandardizer& TextPipeline::standardizer() const noexcept { return impl_->standardizer; }

std::string TextPipeline::process(const std::string& body_markup, int episode_number,
                                  const std::string& date_key) const
{
    PROFILE_SCOPE_CUSTOM("TextPipeline::process");

    logInput(episode_number, body_markup);
    if (body_markup.empty())
        return std::string();

    std::string current = body_markup;

    if (impl_->options.strip_masthead)
    {
        auto stage = run_stage<std::string>("masthead", [&]() { return strip_masthead(current); });
        current = carryForward(stage, current);
    }

    {
        auto stage = run_stage<std::string>("sanitize", [&]() { return impl_->sanitizer.sanitize(current); });
        current = carryForward(stage, current);
    }

    if (impl_->options.strip_disclaimer)
    {
        auto stage = run_stage<std::string>("disclaimer", [&]() { return strip_disclaimer(current); });
        current = carryForward(stage, current);
    }

    {
        auto stage = run_stage<std::string>(
            "standardize", [&]() { return impl_->standardizer.standardizeText(current, episode_number, date_key); });
        current = carryForward(stage, current);
    }

    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[TextPipeline] ep=" << episode_number << " stage=complete output=" << Diagnostics::Preview(current);
    return current;
}

} // namespace processing
