#pragma once

#include "RequestHandlers.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace httplib
{
class Server;
struct Request;
struct Response;
} // namespace httplib

namespace server
{

struct HttpServerOptions
{
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string cors_origin = "*";
    int thread_count = 8;
};

// cpp-httplib front end for RequestHandlers. listen() blocks until stop() is called.
// A stop() issued before the socket is bound makes listen() return at once;
// one issued while httplib is still entering its accept loop may be missed,
// so callers that race startup keep calling stop() until listen() returns.
class HttpServer
{
public:
    HttpServer(RequestHandlers& handlers, HttpServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool listen();
    void stop();
    bool isRunning() const;

    // Routes and aliases served for each analysis kind.
    static const char* const kDetectRoutes[2];
    static const char* const kSummarizeRoutes[2];
    static const char* const kGenerateRoutes[2];

private:
    void registerRoutes();
    void registerAnalysisRoute(const char* path, analysis::RequestKind kind);
    void applyCors(httplib::Response& res) const;
    void send(httplib::Response& res, const HandlerResponse& response) const;

    RequestHandlers& handlers_;
    HttpServerOptions options_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> stop_requested_{ false };
};

} // namespace server
