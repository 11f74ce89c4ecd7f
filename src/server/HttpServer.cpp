#include "HttpServer.hpp"

#include "../utils/ErrorReporter.hpp"

#include <httplib.h>
#include <plog/Log.h>

#include <exception>

namespace server
{

const char* const HttpServer::kDetectRoutes[2] = { "/detectAIText", "/api/detect" };
const char* const HttpServer::kSummarizeRoutes[2] = { "/summarizeText", "/api/summarize" };
const char* const HttpServer::kGenerateRoutes[2] = { "/generateText", "/api/generate" };

HttpServer::HttpServer(RequestHandlers& handlers, HttpServerOptions options)
    : handlers_(handlers)
    , options_(std::move(options))
    , server_(std::make_unique<httplib::Server>())
{
    const int threads = options_.thread_count > 0 ? options_.thread_count : 8;
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(static_cast<size_t>(threads)); };
    registerRoutes();
}

HttpServer::~HttpServer()
{
    stop();
}

void HttpServer::applyCors(httplib::Response& res) const
{
    res.set_header("Access-Control-Allow-Origin", options_.cors_origin);
    res.set_header("Access-Control-Allow-Methods", "POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

void HttpServer::send(httplib::Response& res, const HandlerResponse& response) const
{
    applyCors(res);
    res.status = response.status;
    if (!response.body.is_null())
        res.set_content(response.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                        "application/json");
}

void HttpServer::registerAnalysisRoute(const char* path, analysis::RequestKind kind)
{
    auto handler = [this, kind](const httplib::Request& req, httplib::Response& res) {
        send(res, handlers_.handle(kind, req.method, req.body));
    };
    server_->Post(path, handler);
    server_->Get(path, handler);
    server_->Put(path, handler);
    server_->Patch(path, handler);
    server_->Delete(path, handler);
}

void HttpServer::registerRoutes()
{
    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        PLOG_INFO << "[http] " << req.method << " " << req.path << " -> " << res.status;
    });

    server_->set_exception_handler([this](const httplib::Request& req, httplib::Response& res,
                                          std::exception_ptr ep) {
        std::string what = "unknown error";
        try
        {
            if (ep)
                std::rethrow_exception(ep);
        }
        catch (const std::exception& e)
        {
            what = e.what();
        }
        catch (...)
        {
            what = "non-standard exception";
        }
        PLOG_ERROR << "[exception] " << req.method << " " << req.path << " : " << what;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Server, "Unhandled exception in route", what);
        send(res, RequestHandlers::error(500, "Internal server error: " + what));
    });

    // Preflight for every route.
    server_->Options(R"(.*)", [this](const httplib::Request& req, httplib::Response& res) {
        applyCors(res);
        if (req.has_header("Access-Control-Request-Headers"))
            res.set_header("Access-Control-Allow-Headers", req.get_header_value("Access-Control-Request-Headers"));
        res.status = 204;
    });

    for (const char* path : kDetectRoutes)
        registerAnalysisRoute(path, analysis::RequestKind::Detection);
    for (const char* path : kSummarizeRoutes)
        registerAnalysisRoute(path, analysis::RequestKind::Summarization);
    for (const char* path : kGenerateRoutes)
        registerAnalysisRoute(path, analysis::RequestKind::Generation);

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        send(res, { 200, handlers_.health() });
    });
}

bool HttpServer::listen()
{
    if (!server_->bind_to_port(options_.host, options_.port))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Server, "Failed to start HTTP server",
                                          "Cannot bind " + options_.host + ":" + std::to_string(options_.port));
        return false;
    }
    if (stop_requested_)
    {
        PLOG_INFO << "Stop requested before serving; not accepting connections";
        return true;
    }

    PLOG_INFO << "Listening on http://" << options_.host << ":" << options_.port;
    return server_->listen_after_bind();
}

void HttpServer::stop()
{
    stop_requested_ = true;
    if (server_ && server_->is_running())
    {
        PLOG_INFO << "Stopping HTTP server";
        server_->stop();
    }
}

bool HttpServer::isRunning() const
{
    return server_ && server_->is_running();
}

} // namespace server
