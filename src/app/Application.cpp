#include "Application.hpp"
#include "app/Version.hpp"
#include "analysis/DetectionOrchestrator.hpp"
#include "analysis/GenerationOrchestrator.hpp"
#include "analysis/SummarizationOrchestrator.hpp"
#include "config/ConfigManager.hpp"
#include "oracle/HttpClassifierOracle.hpp"
#include "oracle/HttpGeneratorOracle.hpp"
#include "persistence/ResultStore.hpp"
#include "processing/Diagnostics.hpp"
#include "server/HttpServer.hpp"
#include "server/RequestHandlers.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace
{

// Set from the signal handler; polled by the shutdown watcher thread.
volatile std::sig_atomic_t g_signal_received = 0;

extern "C" void onTerminationSignal(int signum)
{
    g_signal_received = signum;
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

const char* Application::usage()
{
    return "Usage: textsense [--config <path>] [--port <N>] [--verbose]\n"
           "  --config <path>  configuration file (default: config.toml)\n"
           "  --port <N>       override [server] port\n"
           "  --verbose        debug logging and per-stage pipeline traces\n"
           "  --help           show this message\n";
}

bool Application::parseCommandLineArgs(int argc, char** argv, CommandLine& out, std::string& error)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--config")
        {
            if (i + 1 >= argc)
            {
                error = "--config requires a path";
                return false;
            }
            out.config_path = argv[++i];
        }
        else if (arg == "--port")
        {
            if (i + 1 >= argc)
            {
                error = "--port requires a number";
                return false;
            }
            char* end = nullptr;
            const long port = std::strtol(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || port < 0 || port > 65535)
            {
                error = std::string("invalid port: ") + argv[i];
                return false;
            }
            out.port = static_cast<int>(port);
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            out.verbose = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            out.show_help = true;
        }
        else
        {
            error = "unknown argument: " + arg;
            return false;
        }
    }
    return true;
}

int Application::run()
{
    std::string error;
    if (!parseCommandLineArgs(argc_, argv_, cli_, error))
    {
        std::cerr << "textsense: " << error << "\n" << usage();
        return 2;
    }
    if (cli_.show_help)
    {
        std::cout << usage();
        return 0;
    }

    if (!initialize())
    {
        cleanup();
        return 1;
    }

    running_ = true;
    installSignalHandlers();
    shutdown_watcher_ = std::thread([this] { watchForShutdown(); });

    PLOG_INFO << "textsense " << app::kVersionString << " serving";
    const bool served = server_->listen();

    running_ = false;
    cleanup();
    return served ? 0 : 1;
}

void Application::requestExit()
{
    if (server_)
        server_->stop();
}

bool Application::initialize()
{
    PROFILE_SCOPE_FUNCTION();

    if (!initializeLogging())
        return false;
    if (!initializeConfig())
        return false;
    if (!setupOracles())
        return false;
    setupServices();
    return true;
}

bool Application::initializeLogging()
{
    utils::LogManager::Options options;
    utils::LogManager::ReadOptions(cli_.config_path, options);
    if (cli_.verbose)
        options.level = plog::debug;

    if (!utils::LogManager::Initialize(options))
    {
        std::cerr << "textsense: failed to initialize logging\n";
        return false;
    }

    utils::LogManager::RegisterLogger<0>({ .name = "main", .file = "run.log", .console = true });
    utils::LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(
        { .name = "pipeline", .file = "pipeline.log", .level = plog::debug });
#if TEXTSENSE_PROFILING_LEVEL >= 1
    utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>(
        { .name = "profiling", .file = "profiling.log", .level = plog::debug });
#endif

    processing::Diagnostics::SetVerbose(cli_.verbose || options.verbose_pipeline);
    return true;
}

bool Application::initializeConfig()
{
    config_manager_ = std::make_unique<ConfigManager>(cli_.config_path);
    if (!registerServiceConfig(*config_manager_, config_))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Config sections clash",
                                          config_manager_->lastError());
        return false;
    }

    // A parse error is reported by ConfigManager; the service continues on defaults.
    config_manager_->load();

    if (cli_.port)
        config_.server.port = *cli_.port;
    if (cli_.verbose)
        processing::Diagnostics::SetVerbose(true);
    else
        utils::LogManager::SetLevel<0>(static_cast<plog::Severity>(config_.logging.level));
    return true;
}

bool Application::setupOracles()
{
    classifier_ = std::make_unique<oracle::HttpClassifierOracle>();
    generator_ = std::make_unique<oracle::HttpGeneratorOracle>("Generator");
    summarizer_ = std::make_unique<oracle::HttpGeneratorOracle>("Summarizer");

    const auto summarizer_cfg = config_.effectiveSummarizer();
    if (!classifier_->init(config_.classifier) || !generator_->init(config_.generator) ||
        !summarizer_->init(summarizer_cfg))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Oracle configuration is invalid",
                                          "See [oracle.*] sections in " + cli_.config_path);
        return false;
    }

    // Unreachable backends are not fatal: requests degrade to fallback results until they come up.
    for (const auto& status :
         { classifier_->testConnection(), generator_->testConnection(), summarizer_->testConnection() })
    {
        if (status.rfind("Success", 0) == 0)
            PLOG_INFO << status;
        else
            PLOG_WARNING << status;
    }
    return true;
}

void Application::setupServices()
{
    detector_ = std::make_unique<analysis::DetectionOrchestrator>(*classifier_, config_.analysis.detection);
    generation_ = std::make_unique<analysis::GenerationOrchestrator>(*generator_, config_.analysis.generation);
    summarization_ = std::make_unique<analysis::SummarizationOrchestrator>(
        *summarizer_, config_.analysis.summarization, config_.analysis.generation);

    if (config_.persistence.enabled)
    {
        store_ = std::make_unique<persistence::JsonlResultStore>(
            config_.persistence.path, config_.persistence.snippet_chars, config_.persistence.max_pending);
        PLOG_INFO << "Persisting results to " << config_.persistence.path;
    }
    else
    {
        store_ = std::make_unique<persistence::NullResultStore>();
        PLOG_INFO << "Result persistence disabled";
    }

    handlers_ = std::make_unique<server::RequestHandlers>(*detector_, *summarization_, *generation_, *store_,
                                                          config_.analysis);

    server::HttpServerOptions options;
    options.host = config_.server.host;
    options.port = config_.server.port;
    options.cors_origin = config_.server.cors_origin;
    options.thread_count = config_.server.thread_count;
    server_ = std::make_unique<server::HttpServer>(*handlers_, options);
}

void Application::installSignalHandlers()
{
    std::signal(SIGINT, onTerminationSignal);
    std::signal(SIGTERM, onTerminationSignal);
}

void Application::watchForShutdown()
{
    PROFILE_THREAD_NAME("ShutdownWatcher");
    bool announced = false;
    // running_ drops once listen() has returned. Until then the stop is
    // repeated, since one that lands while httplib is starting up is lost.
    while (running_)
    {
        if (g_signal_received != 0)
        {
            if (!announced)
            {
                PLOG_INFO << "Received signal " << static_cast<int>(g_signal_received) << ", shutting down";
                announced = true;
            }
            requestExit();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void Application::cleanup()
{
    if (cleaned_up_)
        return;
    cleaned_up_ = true;
    running_ = false;

    if (server_)
        server_->stop();
    if (shutdown_watcher_.joinable())
        shutdown_watcher_.join();

    // Abort in-flight inference before draining the result log.
    if (classifier_)
        classifier_->shutdown();
    if (generator_)
        generator_->shutdown();
    if (summarizer_)
        summarizer_->shutdown();

    if (store_)
    {
        store_->flush();
        PLOG_INFO << "Result store flushed";
    }

    server_.reset();
    handlers_.reset();
    store_.reset();
    utils::LogManager::Shutdown();
}
