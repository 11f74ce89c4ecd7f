#pragma once

#include "../config/ServiceConfig.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>

class ConfigManager;

namespace oracle
{
class HttpClassifierOracle;
class HttpGeneratorOracle;
} // namespace oracle

namespace analysis
{
class DetectionOrchestrator;
class GenerationOrchestrator;
class SummarizationOrchestrator;
} // namespace analysis

namespace persistence
{
class IResultStore;
}

namespace server
{
class RequestHandlers;
class HttpServer;
} // namespace server

class Application
{
public:
    struct CommandLine
    {
        std::string config_path = "config.toml";
        std::optional<int> port;
        bool verbose = false;
        bool show_help = false;
    };

    Application(int argc, char** argv);
    ~Application();

    int run();
    void requestExit();

    // Returns false with a message in `error` on malformed arguments.
    static bool parseCommandLineArgs(int argc, char** argv, CommandLine& out, std::string& error);
    static const char* usage();

private:
    bool initialize();
    bool initializeLogging();
    bool initializeConfig();
    bool setupOracles();
    void setupServices();
    void installSignalHandlers();
    void watchForShutdown();
    void cleanup();

    int argc_;
    char** argv_;
    CommandLine cli_;

    std::unique_ptr<ConfigManager> config_manager_;
    ServiceConfig config_;

    std::unique_ptr<oracle::HttpClassifierOracle> classifier_;
    std::unique_ptr<oracle::HttpGeneratorOracle> generator_;
    std::unique_ptr<oracle::HttpGeneratorOracle> summarizer_;

    std::unique_ptr<analysis::DetectionOrchestrator> detector_;
    std::unique_ptr<analysis::GenerationOrchestrator> generation_;
    std::unique_ptr<analysis::SummarizationOrchestrator> summarization_;

    std::unique_ptr<persistence::IResultStore> store_;
    std::unique_ptr<server::RequestHandlers> handlers_;
    std::unique_ptr<server::HttpServer> server_;

    std::thread shutdown_watcher_;
    std::atomic<bool> running_{ false };
    bool cleaned_up_ = false;
};
