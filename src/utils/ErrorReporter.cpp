#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_recent;
std::array<std::uint64_t, kErrorCategoryCount> ErrorReporter::s_counts{};

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                                const std::string& details)
{
    const auto now = std::chrono::system_clock::now();
    bool repeated = false;
    std::uint64_t occurrences = 1;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        ++s_counts[static_cast<std::size_t>(category)];

        if (!s_recent.empty())
        {
            auto& last = s_recent.back();
            if (last.category == category && last.severity == severity && last.message == message &&
                last.details == details)
            {
                ++last.occurrences;
                last.last_seen = now;
                occurrences = last.occurrences;
                repeated = true;
            }
        }
        if (!repeated)
        {
            s_recent.push_back({ category, severity, message, details, now, now, 1 });
            while (s_recent.size() > kMaxRecent)
                s_recent.pop_front();
        }
    }

    std::string line = std::string("[") + CategoryToString(category) + "] " + message;
    if (!details.empty())
        line += " | " + details;

    if (repeated)
    {
        PLOG_DEBUG << line << " (repeated x" << occurrences << ")";
        return;
    }

    switch (severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << line;
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << line;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << line;
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << line;
        break;
    }
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& message, const std::string& details)
{
    ReportError(category, ErrorSeverity::Fatal, message, details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    ReportError(category, ErrorSeverity::Error, message, details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    ReportError(category, ErrorSeverity::Warning, message, details);
}

std::vector<ErrorReport> ErrorReporter::Recent(std::size_t max_count)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    const std::size_t count = std::min(max_count, s_recent.size());
    return std::vector<ErrorReport>(s_recent.end() - static_cast<std::ptrdiff_t>(count), s_recent.end());
}

std::array<std::uint64_t, kErrorCategoryCount> ErrorReporter::Counts()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_counts;
}

void ErrorReporter::Reset()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_recent.clear();
    s_counts.fill(0);
}

nlohmann::json ErrorReporter::Snapshot(std::size_t max_recent)
{
    const auto counts = Counts();
    nlohmann::json by_category = nlohmann::json::object();
    for (std::size_t i = 0; i < counts.size(); ++i)
    {
        if (counts[i] > 0)
            by_category[CategoryToString(static_cast<ErrorCategory>(i))] = counts[i];
    }

    nlohmann::json recent = nlohmann::json::array();
    for (const auto& report : Recent(max_recent))
    {
        recent.push_back({ { "category", CategoryToString(report.category) },
                           { "severity", SeverityToString(report.severity) },
                           { "message", report.message },
                           { "occurrences", report.occurrences },
                           { "lastSeen", FormatTimestamp(report.last_seen) } });
    }
    return { { "counts", std::move(by_category) }, { "recent", std::move(recent) } };
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "initialization";
    case ErrorCategory::Configuration:
        return "configuration";
    case ErrorCategory::Validation:
        return "validation";
    case ErrorCategory::Oracle:
        return "oracle";
    case ErrorCategory::Persistence:
        return "persistence";
    case ErrorCategory::Server:
        return "server";
    case ErrorCategory::Unknown:
        break;
    }
    return "unknown";
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "info";
    case ErrorSeverity::Warning:
        return "warning";
    case ErrorSeverity::Error:
        return "error";
    case ErrorSeverity::Fatal:
        return "fatal";
    }
    return "unknown";
}

std::string ErrorReporter::FormatTimestamp(std::chrono::system_clock::time_point tp)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace utils
