#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "oracle/HttpClassifierOracle.hpp"
#include "oracle/HttpGeneratorOracle.hpp"
#include "oracle/HttpCommon.hpp"

#include <cstdint>
#include <vector>

using namespace oracle;
using Catch::Matchers::WithinAbs;

TEST_CASE("HTTP classifier oracle", "[oracle][http]") {

    SECTION("Initialization") {
        HttpClassifierOracle classifier;

        SECTION("Rejects a missing base URL") {
            OracleConfig config;
            REQUIRE_FALSE(classifier.init(config));
            REQUIRE_FALSE(classifier.isReady());
            REQUIRE(classifier.lastError() == "Missing base URL");
        }

        SECTION("Rejects a URL without scheme") {
            OracleConfig config;
            config.base_url = "localhost:8001";
            REQUIRE_FALSE(classifier.init(config));
        }

        SECTION("Normalizes the base URL") {
            OracleConfig config;
            config.base_url = "http://127.0.0.1:8001//";
            config.max_input_tokens = 0;
            REQUIRE(classifier.init(config));
            REQUIRE(classifier.isReady());
            REQUIRE(classifier.config().base_url == "http://127.0.0.1:8001");
            REQUIRE(classifier.config().max_input_tokens == kDefaultMaxInputTokens);
            classifier.shutdown();
            REQUIRE_FALSE(classifier.isReady());
        }
    }

    SECTION("Calls before init fail with OracleError") {
        HttpClassifierOracle classifier;
        REQUIRE_THROWS_AS(classifier.encode("some text"), OracleError);
        REQUIRE_THROWS_AS(classifier.classify(EncodedInput{{1, 2, 3}, false}), OracleError);
    }

    SECTION("Unreachable backend fails with OracleError") {
        HttpClassifierOracle classifier;
        OracleConfig config;
        config.base_url = "http://127.0.0.1:1";
        config.connect_timeout_ms = 500;
        config.timeout_ms = 1000;
        config.max_retries = 0;
        REQUIRE(classifier.init(config));
        REQUIRE_THROWS_AS(classifier.encode("some text"), OracleError);
        REQUIRE_FALSE(classifier.lastError().empty());
        REQUIRE(classifier.testConnection().rfind("Error", 0) == 0);
    }
}

TEST_CASE("Generate request body carries the sampling policy", "[oracle][http]") {
    EncodedInput input{{5, 6, 7}, false};

    SECTION("Without seed") {
        SamplingPolicy policy(650, 0.7);
        const auto body = HttpGeneratorOracle::buildGenerateBody(input, policy);
        REQUIRE(body["tokens"] == nlohmann::json::array({5, 6, 7}));
        REQUIRE(body["max_length"] == 650);
        REQUIRE(body["min_length"] == 50);
        REQUIRE_THAT(body["temperature"].get<double>(), WithinAbs(0.7, 1e-12));
        REQUIRE(body["top_k"] == 50);
        REQUIRE_THAT(body["top_p"].get<double>(), WithinAbs(0.95, 1e-12));
        REQUIRE(body["no_repeat_ngram_size"] == 3);
        REQUIRE(body["num_return_sequences"] == 1);
        REQUIRE(body["do_sample"] == true);
        REQUIRE_FALSE(body.contains("seed"));
    }

    SECTION("With seed") {
        SamplingDefaults defaults;
        defaults.seed = 7;
        const auto body = HttpGeneratorOracle::buildGenerateBody(input, SamplingPolicy(130, 0.1, defaults));
        REQUIRE(body["seed"] == 7);
    }
}

TEST_CASE("HTTP failure classification", "[oracle][http]") {
    auto transport = [](const char* message) {
        HttpResponse response;
        response.transport_error = message;
        return response;
    };
    auto status = [](int code) {
        HttpResponse response;
        response.status_code = code;
        response.text = "body";
        return response;
    };

    REQUIRE(classifyFailure(status(200)) == FailureKind::None);
    REQUIRE(classifyFailure(transport("Operation timed out")) == FailureKind::Timeout);
    REQUIRE(classifyFailure(transport("Callback aborted")) == FailureKind::Aborted);
    REQUIRE(classifyFailure(transport("Couldn't connect to server")) == FailureKind::Unreachable);
    REQUIRE(classifyFailure(status(413)) == FailureKind::PayloadTooLarge);
    REQUIRE(classifyFailure(status(422)) == FailureKind::Rejected);
    REQUIRE(classifyFailure(status(503)) == FailureKind::Backend);

    SECTION("Only transient failures are retried") {
        REQUIRE(isTransient(FailureKind::Backend, 503));
        REQUIRE(isTransient(FailureKind::Rejected, 429));
        REQUIRE_FALSE(isTransient(FailureKind::Rejected, 400));
        REQUIRE_FALSE(isTransient(FailureKind::Aborted, 0));
    }

    SECTION("Descriptions carry the status and a clipped body") {
        REQUIRE(describeFailure(FailureKind::Backend, status(503)) == "backend error (HTTP 503): body");
        REQUIRE(clip(std::string(300, 'a')).size() == 203);
        REQUIRE(clip("short") == "short");
    }
}

TEST_CASE("Token arrays must hold int32 ids", "[oracle][http]") {
    using nlohmann::json;

    SECTION("In-range ids are kept") {
        const auto tokens = HttpOracleBase::parseTokenArray(json::array({0, 101, 2147483647, -2147483648LL}), "tokens");
        REQUIRE(tokens == std::vector<std::int32_t>{0, 101, 2147483647, -2147483647 - 1});
    }

    SECTION("Ids beyond int32 are rejected instead of wrapped") {
        REQUIRE_THROWS_AS(HttpOracleBase::parseTokenArray(json::array({1, 3000000000LL}), "tokens"), OracleError);
        REQUIRE_THROWS_AS(HttpOracleBase::parseTokenArray(json::array({-2147483649LL}), "tokens"), OracleError);
        REQUIRE_THROWS_AS(HttpOracleBase::parseTokenArray(json::array({18446744073709551615ULL}), "tokens"),
                          OracleError);
    }

    SECTION("Non-integers and non-arrays are rejected") {
        REQUIRE_THROWS_AS(HttpOracleBase::parseTokenArray(json::array({1.5}), "tokens"), OracleError);
        REQUIRE_THROWS_AS(HttpOracleBase::parseTokenArray(json::object(), "tokens"), OracleError);
    }
}
