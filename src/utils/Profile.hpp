#pragma once

#include <chrono>
#include <string>
#include <string_view>

// TXA_PROFILING_LEVEL is set via CMake:
//   0 = Disabled (no profiling)
//   1 = Scoped timers logged through plog instance kProfilingLogInstance

#ifndef TXA_PROFILING_LEVEL
#define TXA_PROFILING_LEVEL 0
#endif

#if TXA_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace profiling
{

constexpr int kProfilingLogInstance = 2;

namespace detail
{

#if TXA_PROFILING_LEVEL >= 1
/**
 * @brief RAII scope timer for measuring and logging execution time
 *
 * Captures start time on construction and logs elapsed time on destruction.
 * The name is copied so callers may pass temporaries.
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name)
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
        PLOG_DEBUG_(profiling::kProfilingLogInstance) << "[PROFILE] " << name_ << " took " << duration.count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&) = delete;
    ScopeTimer& operator=(ScopeTimer&&) = delete;

private:
    std::string name_;
    std::chrono::steady_clock::time_point start_;
};
#endif

} // namespace detail

} // namespace profiling

#if TXA_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))
#else
#define PROFILE_SCOPE_FUNCTION() ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer __profiling_timer(nameExpr)
#endif
