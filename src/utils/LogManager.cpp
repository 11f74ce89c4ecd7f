#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"
#include "../processing/Diagnostics.hpp"

#include <plog/Appenders/ColorConsoleAppender.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <toml++/toml.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::Options LogManager::s_options;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

void LogManager::ReadOptions(const std::string& config_path, Options& out)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return;

    try
    {
        const auto cfg = toml::parse_file(config_path);
        const auto* logging = cfg["logging"].as_table();
        if (!logging)
            return;

        if (auto level = (*logging)["level"].value<std::int64_t>(); level && *level >= plog::none && *level <= plog::verbose)
            out.level = static_cast<plog::Severity>(*level);
        if (auto append = (*logging)["append"].value<bool>())
            out.append = *append;
        if (auto verbose = (*logging)["verbose_pipeline"].value<bool>())
            out.verbose_pipeline = *verbose;
    }
    catch (const toml::parse_error&)
    {
        // Reported by ConfigManager once a logger is available.
    }
}

bool LogManager::Initialize(const Options& options)
{
    if (s_initialized)
        return true;

    s_options = options;
    std::error_code ec;
    std::filesystem::create_directories(s_options.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportFatal(ErrorCategory::Initialization, "Unable to create log directory",
                                   s_options.directory + ": " + ec.message());
        return false;
    }

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerSpec& spec)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logger registered before LogManager::Initialize",
                                   spec.name);
        return false;
    }

    const auto path = (std::filesystem::path(s_options.directory) / spec.file).string();
    if (!s_options.append)
        std::ofstream(path, std::ios::trunc).close();

    try
    {
        auto file = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(path.c_str(), spec.max_file_size,
                                                                                    spec.backup_count);
        auto& logger = plog::init<InstanceId>(spec.level.value_or(s_options.level), file.get());
        s_appenders.push_back(std::move(file));

        if (spec.console)
        {
            std::unique_ptr<plog::IAppender> console;
            if (::isatty(STDOUT_FILENO))
                console = std::make_unique<plog::ColorConsoleAppender<plog::TxtFormatter>>();
            else
                console = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console.get());
            s_appenders.push_back(std::move(console));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log " + spec.name, ex.what());
        return false;
    }
}

template <int InstanceId>
void LogManager::SetLevel(plog::Severity level)
{
    if (auto* logger = plog::get<InstanceId>())
        logger->setMaxSeverity(level);
}

template bool LogManager::RegisterLogger<0>(const LoggerSpec&);
template bool LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(const LoggerSpec&);
template void LogManager::SetLevel<0>(plog::Severity);

#if TEXTSENSE_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerSpec&);
#endif

void LogManager::Shutdown()
{
    // plog keeps raw appender pointers; silence the loggers before releasing them.
    SetLevel<0>(plog::none);
    if (auto* logger = plog::get<processing::Diagnostics::kLogInstance>())
        logger->setMaxSeverity(plog::none);
#if TEXTSENSE_PROFILING_LEVEL >= 1
    if (auto* logger = plog::get<profiling::kProfilingLogInstance>())
        logger->setMaxSeverity(plog::none);
#endif
    s_appenders.clear();
    s_initialized = false;
}

const LogManager::Options& LogManager::GetOptions() { return s_options; }

bool LogManager::IsInitialized() { return s_initialized; }

} // namespace utils
