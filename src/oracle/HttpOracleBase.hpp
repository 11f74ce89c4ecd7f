#pragma once

#include "OracleTypes.hpp"
#include "../utils/ErrorReporter.hpp"
#include "HttpCommon.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace oracle
{

struct OracleConfig
{
    std::string base_url;
    std::string api_key;
    std::size_t max_input_tokens = kDefaultMaxInputTokens;
    int connect_timeout_ms = 5000;
    int timeout_ms = 60000;
    int max_retries = 1;
};

/**
 * @brief Shared plumbing for oracles served by a JSON inference server.
 *
 * Owns the endpoint configuration, the running flag used to abort in-flight
 * transfers, the retry loop and the /tokenize and /detokenize calls that both
 * model kinds expose. Every call builds its own HTTP session, so a single
 * instance may be used from many request threads at once.
 */
class HttpOracleBase
{
public:
    HttpOracleBase() = default;
    virtual ~HttpOracleBase();

    HttpOracleBase(const HttpOracleBase&) = delete;
    HttpOracleBase& operator=(const HttpOracleBase&) = delete;

    bool init(const OracleConfig& cfg);
    bool isReady() const;
    void stop();

    std::string lastError() const;
    const OracleConfig& config() const { return cfg_; }

    // Calls GET {base_url}/health and returns a human readable status line.
    std::string testConnection();

    // Throws OracleError unless value is an array of integers that fit in int32.
    static std::vector<std::int32_t> parseTokenArray(const nlohmann::json& value, const char* field);

protected:
    virtual const char* providerName() const = 0;
    virtual std::string validateConfig(const OracleConfig& cfg) const;
    virtual bool shouldRetry(FailureKind kind, const HttpResponse& resp) const;

    // POSTs body to {base_url}{endpoint}, retrying transient failures. Throws OracleError.
    nlohmann::json postEndpoint(const std::string& endpoint, const nlohmann::json& body);

    EncodedInput tokenize(const std::string& text, std::size_t max_tokens, bool truncate);
    std::string detokenize(const std::vector<std::int32_t>& tokens);

    HttpRequest makeRequest(HttpMethod method, const std::string& endpoint) const;
    void setLastError(const std::string& message);
    [[noreturn]] void fail(const std::string& message, const std::string& details = {});

    OracleConfig cfg_{};
    std::atomic<bool> running_{ false };

private:
    mutable std::mutex err_mtx_;
    std::string last_error_;
};

} // namespace oracle
