#include "HttpOracleBase.hpp"
#include "../processing/Diagnostics.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <thread>

namespace oracle
{

HttpOracleBase::~HttpOracleBase()
{
    stop();
}

bool HttpOracleBase::init(const OracleConfig& cfg)
{
    stop();
    cfg_ = cfg;
    setLastError({});

    const auto validation_error = validateConfig(cfg_);
    if (!validation_error.empty())
    {
        setLastError(validation_error);
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization,
                                          std::string(providerName()) + " oracle misconfigured", validation_error);
        return false;
    }

    while (!cfg_.base_url.empty() && cfg_.base_url.back() == '/')
        cfg_.base_url.pop_back();
    if (cfg_.max_input_tokens == 0)
        cfg_.max_input_tokens = kDefaultMaxInputTokens;
    cfg_.max_retries = std::max(0, cfg_.max_retries);

    running_.store(true, std::memory_order_relaxed);
    PLOG_INFO << providerName() << " oracle ready at " << cfg_.base_url;
    return true;
}

bool HttpOracleBase::isReady() const
{
    return running_.load(std::memory_order_relaxed);
}

void HttpOracleBase::stop()
{
    running_.store(false, std::memory_order_relaxed);
}

std::string HttpOracleBase::lastError() const
{
    std::lock_guard<std::mutex> lk(err_mtx_);
    return last_error_;
}

void HttpOracleBase::setLastError(const std::string& message)
{
    std::lock_guard<std::mutex> lk(err_mtx_);
    last_error_ = message;
}

void HttpOracleBase::fail(const std::string& message, const std::string& details)
{
    setLastError(message);
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Oracle,
                                        std::string(providerName()) + " request failed",
                                        details.empty() ? message : message + " - " + details);
    throw OracleError(message);
}

std::string HttpOracleBase::testConnection()
{
    if (cfg_.base_url.empty())
        return "Config Error: Missing base URL";

    auto request = makeRequest(HttpMethod::Get, "/health");
    request.connect_timeout_ms = 3000;
    request.timeout_ms = 8000;

    const auto resp = perform(request);
    if (!resp.transport_error.empty())
        return "Error: Cannot connect to " + cfg_.base_url + " - " + resp.transport_error;
    if (!resp.ok())
        return "Error: " + cfg_.base_url + " returned HTTP " + std::to_string(resp.status_code);
    return std::string("Success: ") + providerName() + " backend reachable";
}

std::string HttpOracleBase::validateConfig(const OracleConfig& cfg) const
{
    if (cfg.base_url.empty())
        return "Missing base URL";
    if (cfg.base_url.find("://") == std::string::npos)
        return "Base URL must include a scheme: " + cfg.base_url;
    return {};
}

bool HttpOracleBase::shouldRetry(FailureKind kind, const HttpResponse& resp) const
{
    return isTransient(kind, resp.status_code);
}

HttpRequest HttpOracleBase::makeRequest(HttpMethod method, const std::string& endpoint) const
{
    HttpRequest request;
    request.method = method;
    request.url = cfg_.base_url + endpoint;
    request.connect_timeout_ms = cfg_.connect_timeout_ms;
    request.timeout_ms = cfg_.timeout_ms;
    request.headers.emplace_back("Accept", "application/json");
    if (!cfg_.api_key.empty())
        request.headers.emplace_back("Authorization", "Bearer " + cfg_.api_key);
    return request;
}

nlohmann::json HttpOracleBase::postEndpoint(const std::string& endpoint, const nlohmann::json& body)
{
    PROFILE_SCOPE_CUSTOM(endpoint);

    if (!isReady())
        fail(std::string(providerName()) + " oracle not ready");

    auto request = makeRequest(HttpMethod::Post, endpoint);
    request.body = body.dump();
    request.keep_running = &running_;
    PLOG_DEBUG << providerName() << " POST " << request.url << " body=" << processing::Diagnostics::Preview(request.body);

    std::string error_message;
    for (int attempt = 0;; ++attempt)
    {
        const auto response = perform(request);
        if (response.ok())
        {
            try
            {
                return nlohmann::json::parse(response.text);
            }
            catch (const nlohmann::json::parse_error& ex)
            {
                fail("invalid JSON from " + endpoint, ex.what());
            }
        }

        const auto kind = classifyFailure(response);
        error_message = describeFailure(kind, response);

        if (!isReady() || kind == FailureKind::Aborted)
            fail(std::string(providerName()) + " request aborted", endpoint);

        if (!shouldRetry(kind, response) || attempt >= cfg_.max_retries)
            break;

        const auto backoff = std::chrono::milliseconds(200 * (attempt + 1));
        PLOG_WARNING << providerName() << " " << endpoint << " attempt " << (attempt + 1) << " failed ("
                     << error_message << "), retrying in " << backoff.count() << "ms";
        std::this_thread::sleep_for(backoff);
    }

    fail(error_message, endpoint);
}

std::vector<std::int32_t> HttpOracleBase::parseTokenArray(const nlohmann::json& value, const char* field)
{
    if (!value.is_array())
        throw OracleError(std::string("expected token array in '") + field + "'");

    std::vector<std::int32_t> tokens;
    tokens.reserve(value.size());
    for (const auto& item : value)
    {
        if (!item.is_number_integer())
            throw OracleError(std::string("non-integer token in '") + field + "'");

        constexpr auto kMin = std::numeric_limits<std::int32_t>::min();
        constexpr auto kMax = std::numeric_limits<std::int32_t>::max();
        const bool fits = item.is_number_unsigned()
                              ? item.get<std::uint64_t>() <= static_cast<std::uint64_t>(kMax)
                              : item.get<std::int64_t>() >= kMin && item.get<std::int64_t>() <= kMax;
        if (!fits)
            throw OracleError(std::string("token id out of range in '") + field + "': " + item.dump());
        tokens.push_back(static_cast<std::int32_t>(item.get<std::int64_t>()));
    }
    return tokens;
}

EncodedInput HttpOracleBase::tokenize(const std::string& text, std::size_t max_tokens, bool truncate)
{
    if (max_tokens == 0)
        max_tokens = cfg_.max_input_tokens;

    nlohmann::json body = { { "text", text }, { "max_tokens", max_tokens }, { "truncation", truncate } };
    const auto response = postEndpoint("/tokenize", body);
    if (!response.contains("tokens"))
        fail("missing tokens in /tokenize response");

    EncodedInput encoded;
    try
    {
        encoded.token_ids = parseTokenArray(response["tokens"], "tokens");
    }
    catch (const OracleError& ex)
    {
        fail(ex.what());
    }

    if (encoded.token_ids.size() > max_tokens)
    {
        if (!truncate)
            fail("input exceeds " + std::to_string(max_tokens) + " tokens");
        encoded.token_ids.resize(max_tokens);
        encoded.truncated = true;
    }
    if (response.contains("truncated") && response["truncated"].is_boolean())
        encoded.truncated = encoded.truncated || response["truncated"].get<bool>();

    if (encoded.token_ids.empty())
        fail("tokenizer produced no tokens");
    return encoded;
}

std::string HttpOracleBase::detokenize(const std::vector<std::int32_t>& tokens)
{
    nlohmann::json body = { { "tokens", tokens }, { "skip_special_tokens", true } };
    const auto response = postEndpoint("/detokenize", body);
    if (!response.contains("text") || !response["text"].is_string())
        fail("missing text in /detokenize response");
    return response["text"].get<std::string>();
}

} // namespace oracle
