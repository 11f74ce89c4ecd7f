#pragma once

#include <plog/Severity.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace plog
{
class IAppender;
}

namespace utils
{

// Owns plog appenders for the process. Loggers are plog instances:
// 0 = service log, processing::Diagnostics::kLogInstance = pipeline traces,
// profiling::kProfilingLogInstance = scope timers (profiling builds only).
class LogManager
{
public:
    struct Options
    {
        plog::Severity level = plog::info;
        bool append = true;
        bool verbose_pipeline = false;
        std::string directory = "logs";
    };

    struct LoggerSpec
    {
        std::string name;
        std::string file;                      // relative to Options::directory
        std::optional<plog::Severity> level;   // defaults to Options::level
        std::size_t max_file_size = 10 * 1024 * 1024;
        int backup_count = 3;
        bool console = false;
    };

    // Reads [logging] from the given TOML file. The rest of the configuration is
    // loaded later, once the loggers exist. Missing or malformed files leave `out` unchanged.
    static void ReadOptions(const std::string& config_path, Options& out);

    static bool Initialize(const Options& options);

    template <int InstanceId>
    static bool RegisterLogger(const LoggerSpec& spec);

    template <int InstanceId>
    static void SetLevel(plog::Severity level);

    static void Shutdown();

    static const Options& GetOptions();
    static bool IsInitialized();

private:
    LogManager() = default;

    static bool s_initialized;
    static Options s_options;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
