#pragma once

// Build-time profiling switch, set from CMake (TEXTSENSE_PROFILING_LEVEL):
//   0 = off, the macros expand to nothing
//   1 = scope timers written to the profiling logger
//   2 = Tracy zones in addition to the timers

#ifndef TEXTSENSE_PROFILING_LEVEL
#define TEXTSENSE_PROFILING_LEVEL 0
#endif

#if TEXTSENSE_PROFILING_LEVEL >= 1
#include <plog/Log.h>

#include <chrono>
#include <string>
#include <utility>
#endif

#if TEXTSENSE_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if TEXTSENSE_PROFILING_LEVEL >= 1
namespace profiling
{

constexpr int kProfilingLogInstance = 2;

// Logs the lifetime of a scope on destruction. The label is copied, so
// temporaries such as endpoint strings are safe to pass.
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string label)
        : label_(std::move(label))
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        PLOG_DEBUG_(kProfilingLogInstance) << "[PROFILE] " << label_ << " " << elapsed().count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

    std::chrono::microseconds elapsed() const
    {
        return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
    }

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace profiling
#endif

#define TEXTSENSE_PROFILE_CAT_(a, b) a##b
#define TEXTSENSE_PROFILE_CAT(a, b) TEXTSENSE_PROFILE_CAT_(a, b)
#define TEXTSENSE_PROFILE_VAR TEXTSENSE_PROFILE_CAT(profile_timer_, __LINE__)

#if TEXTSENSE_PROFILING_LEVEL == 0

#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(label) ((void)sizeof(label))
#define PROFILE_THREAD_NAME(name) ((void)0)

#elif TEXTSENSE_PROFILING_LEVEL == 1

#define PROFILE_SCOPE_FUNCTION() ::profiling::ScopeTimer TEXTSENSE_PROFILE_VAR(__func__)
#define PROFILE_SCOPE_CUSTOM(label) ::profiling::ScopeTimer TEXTSENSE_PROFILE_VAR(label)
#define PROFILE_THREAD_NAME(name) ((void)0)

#else

#define PROFILE_SCOPE_FUNCTION() \
    ZoneScoped;                  \
    ::profiling::ScopeTimer TEXTSENSE_PROFILE_VAR(__func__)

// Tracy copies the dynamic zone name, so a temporary label is fine here too.
#define PROFILE_SCOPE_CUSTOM(label)                                      \
    ZoneScoped;                                                          \
    ::profiling::ScopeTimer TEXTSENSE_PROFILE_VAR(label);                \
    {                                                                    \
        const std::string profile_zone_name_(label);                     \
        ZoneName(profile_zone_name_.data(), profile_zone_name_.size());  \
    }

#define PROFILE_THREAD_NAME(name) ::tracy::SetThreadName(name)

#endif
