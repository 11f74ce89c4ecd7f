#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils
{

enum class ErrorCategory
{
    Initialization, // logging, server bind, oracle construction
    Configuration,  // TOML parsing, invalid config values
    Validation,     // rejected request parameters
    Oracle,         // inference backend failures
    Persistence,    // result log writes
    Server,         // HTTP transport
    Unknown
};

inline constexpr std::size_t kErrorCategoryCount = static_cast<std::size_t>(ErrorCategory::Unknown) + 1;

enum class ErrorSeverity
{
    Info,
    Warning, // request served in degraded form
    Error,   // operation failed, service continues
    Fatal    // service cannot start or keep running
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string message;
    std::string details;
    std::chrono::system_clock::time_point first_seen{};
    std::chrono::system_clock::time_point last_seen{};
    std::uint64_t occurrences = 1;
};

/**
 * @brief Process-wide record of failures for logs and the health endpoint.
 *
 * Every report is logged through plog and counted per category. The newest
 * reports are kept in a bounded window; a report identical to the previous
 * one is folded into it (occurrences, last_seen) so that a backend outage
 * hitting every request does not evict everything else or flood the log.
 *
 *   ErrorReporter::ReportWarning(ErrorCategory::Oracle, "Classifier request failed", "HTTP 503");
 *   auto snapshot = ErrorReporter::Snapshot(5);
 */
class ErrorReporter
{
public:
    static constexpr std::size_t kMaxRecent = 50;

    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                            const std::string& details = "");
    static void ReportFatal(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");

    // Newest last, at most max_count entries.
    static std::vector<ErrorReport> Recent(std::size_t max_count);
    static std::array<std::uint64_t, kErrorCategoryCount> Counts();
    static void Reset();

    // {"counts": {category: n, ...}, "recent": [{category, severity, message, occurrences, lastSeen}, ...]}
    static nlohmann::json Snapshot(std::size_t max_recent);

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_recent;
    static std::array<std::uint64_t, kErrorCategoryCount> s_counts;
};

} // namespace utils
