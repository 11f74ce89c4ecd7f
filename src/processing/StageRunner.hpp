#pragma once

#include "Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace processing
{

// Outcome of one orchestration step: an oracle round trip, a heuristic or a repair pass.
// `value` is empty exactly when the step threw, whatever it threw.
template<typename T>
struct StageResult
{
    std::string stage;
    std::optional<T> value;
    std::string error;
    std::chrono::microseconds elapsed{ 0 };

    bool ok() const { return value.has_value(); }
};

/**
 * @brief Runs @p fn and captures its result or the exception it threw.
 *
 * Failures are written to the pipeline log and counted by ErrorReporter under
 * @p category. Orchestrators branch on ok() to pick their fallback result.
 */
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage, Fn&& fn,
                         utils::ErrorCategory category = utils::ErrorCategory::Oracle)
{
    PROFILE_SCOPE_CUSTOM(stage);

    StageResult<T> outcome;
    outcome.stage = stage;
    const auto started = std::chrono::steady_clock::now();
    auto since_start = [&started]
    {
        return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    };

    try
    {
        outcome.value.emplace(std::forward<Fn>(fn)());
        outcome.elapsed = since_start();
        if (Diagnostics::IsVerbose())
            PLOG_INFO_(Diagnostics::kLogInstance) << stage << ": ok (" << outcome.elapsed.count() << "us)";
    }
    catch (const std::exception& ex)
    {
        outcome.elapsed = since_start();
        outcome.error = ex.what();
        PLOG_ERROR_(Diagnostics::kLogInstance) << stage << ": failed after " << outcome.elapsed.count()
                                               << "us: " << outcome.error;
        utils::ErrorReporter::ReportWarning(category, "Pipeline stage failed", stage + ": " + outcome.error);
    }
    catch (...)
    {
        outcome.elapsed = since_start();
        outcome.error = "unknown exception";
        PLOG_ERROR_(Diagnostics::kLogInstance) << stage << ": failed after " << outcome.elapsed.count()
                                               << "us with a non-standard exception";
        utils::ErrorReporter::ReportWarning(category, "Pipeline stage failed", stage + ": " + outcome.error);
    }
    return outcome;
}

} // namespace processing
