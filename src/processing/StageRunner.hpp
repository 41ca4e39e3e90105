#pragma once

#include "TextProcessingTypes.hpp"
#include "Diagnostics.hpp"
#include <chrono>
#include <exception>
#include <string>
#include <utility>
#include <plog/Log.h>

#include "../utils/Profile.hpp"
#include "../utils/ErrorReporter.hpp"

namespace processing {

// Runs one pipeline stage (callable returning T) and wraps it in text_processing::StageResult<T>.
// Exceptions become a failed result so the caller can fall back to the previous stage's output.
template<typename T, typename Fn>
text_processing::StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    using clock = std::chrono::steady_clock;
    auto start = clock::now();
    auto elapsed = [&start]()
    {
        return std::chrono::duration_cast<std::chrono::microseconds>(clock::now() - start);
    };

    try
    {
        T res = fn();
        auto dur = elapsed();
        if (Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return text_processing::StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        auto dur = elapsed();
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Parsing,
            "Transcript pipeline stage failed",
            stage_name + ": " + ex.what());
        return text_processing::StageResult<T>::failure(ex.what(), dur, stage_name);
    }
}

} // namespace processing
