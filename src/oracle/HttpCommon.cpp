#include "HttpCommon.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <initializer_list>

namespace oracle
{

namespace
{

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y)
    {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

bool mentions(const std::string& haystack, std::initializer_list<const char*> needles)
{
    std::string lowered(haystack.size(), '\0');
    std::transform(haystack.begin(), haystack.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::any_of(needles.begin(), needles.end(),
                       [&](const char* needle) { return lowered.find(needle) != std::string::npos; });
}

cpr::Header toCprHeader(const HttpRequest& request)
{
    cpr::Header header;
    bool has_content_type = false;
    for (const auto& [name, value] : request.headers)
    {
        has_content_type = has_content_type || iequals(name, "content-type");
        header.emplace(name, value);
    }
    if (request.method == HttpMethod::Post && !has_content_type)
        header.emplace("Content-Type", "application/json");
    return header;
}

} // namespace

HttpResponse perform(const HttpRequest& request)
{
    cpr::Session session;
    session.SetUrl(cpr::Url{ request.url });
    session.SetHeader(toCprHeader(request));
    session.SetConnectTimeout(cpr::ConnectTimeout{ request.connect_timeout_ms });
    session.SetTimeout(cpr::Timeout{ request.timeout_ms });
    if (request.keep_running)
    {
        session.SetProgressCallback(cpr::ProgressCallback(
            [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool
            {
                return reinterpret_cast<const std::atomic<bool>*>(userdata)->load(std::memory_order_relaxed);
            },
            reinterpret_cast<intptr_t>(request.keep_running)));
    }

    cpr::Response raw;
    if (request.method == HttpMethod::Post)
    {
        session.SetBody(cpr::Body{ request.body });
        raw = session.Post();
    }
    else
    {
        raw = session.Get();
    }

    HttpResponse response;
    if (raw.error)
    {
        response.transport_error = raw.error.message.empty() ? "transport error" : raw.error.message;
        return response;
    }
    response.status_code = static_cast<int>(raw.status_code);
    response.text = std::move(raw.text);
    return response;
}

FailureKind classifyFailure(const HttpResponse& response)
{
    if (!response.transport_error.empty())
    {
        if (mentions(response.transport_error, { "timeout", "timed out" }))
            return FailureKind::Timeout;
        if (mentions(response.transport_error, { "callback", "aborted" }))
            return FailureKind::Aborted;
        return FailureKind::Unreachable;
    }

    const int code = response.status_code;
    if (code >= 200 && code < 300)
        return FailureKind::None;
    if (code == 408 || code == 504)
        return FailureKind::Timeout;
    if (code == 413)
        return FailureKind::PayloadTooLarge;
    if (code >= 500)
        return FailureKind::Backend;
    if (code >= 400)
        return FailureKind::Rejected;
    return FailureKind::Unexpected;
}

bool isTransient(FailureKind kind, int status_code)
{
    switch (kind)
    {
    case FailureKind::Timeout:
    case FailureKind::Unreachable:
    case FailureKind::Backend:
        return true;
    case FailureKind::Rejected:
        return status_code == 429;
    default:
        return false;
    }
}

std::string describeFailure(FailureKind kind, const HttpResponse& response)
{
    const std::string code = std::to_string(response.status_code);
    const std::string detail = clip(response.transport_error.empty() ? response.text : response.transport_error);
    switch (kind)
    {
    case FailureKind::None:
        return {};
    case FailureKind::Timeout:
        return "inference backend timed out";
    case FailureKind::PayloadTooLarge:
        return "input rejected as too large (HTTP 413)";
    case FailureKind::Aborted:
        return "request aborted during shutdown";
    case FailureKind::Unreachable:
        return "backend unreachable: " + detail;
    case FailureKind::Backend:
        return "backend error (HTTP " + code + "): " + detail;
    case FailureKind::Rejected:
        return "request rejected (HTTP " + code + "): " + detail;
    case FailureKind::Unexpected:
        break;
    }
    return "unexpected HTTP " + code + ": " + detail;
}

std::string clip(std::string_view text, std::size_t max_len)
{
    if (text.size() <= max_len)
        return std::string(text);
    std::size_t cut = max_len;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    std::string out(text.substr(0, cut));
    out += "...";
    return out;
}

} // namespace oracle
