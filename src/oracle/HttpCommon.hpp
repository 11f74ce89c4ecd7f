#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace oracle
{

using HeaderList = std::vector<std::pair<std::string, std::string>>;

enum class HttpMethod
{
    Get,
    Post
};

struct HttpRequest
{
    HttpMethod method = HttpMethod::Post;
    std::string url;
    std::string body;
    HeaderList headers;
    int connect_timeout_ms = 5000;
    int timeout_ms = 60000;
    // Transfer keeps going only while this reads true.
    const std::atomic<bool>* keep_running = nullptr;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string transport_error;

    bool ok() const { return transport_error.empty() && status_code >= 200 && status_code < 300; }
};

// Blocking request through a fresh cpr session. Never throws on HTTP or
// transport failures; those are reported through the response.
HttpResponse perform(const HttpRequest& request);

enum class FailureKind
{
    None,
    Timeout,
    PayloadTooLarge,
    Aborted,
    Unreachable,
    Backend,
    Rejected,
    Unexpected
};

FailureKind classifyFailure(const HttpResponse& response);

// Timeouts, 429, 5xx and dropped connections are worth another attempt.
bool isTransient(FailureKind kind, int status_code);

std::string describeFailure(FailureKind kind, const HttpResponse& response);

// Shortens backend bodies for log lines and error messages.
std::string clip(std::string_view text, std::size_t max_len = 200);

} // namespace oracle
