#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <nlohmann/json.hpp>
#include <string>
#include <variant>

#include "analysis/AnalysisRequest.hpp"

using namespace analysis;
using nlohmann::json;
using Catch::Matchers::WithinAbs;

namespace {
const std::string kLongText(60, 'x');
}

TEST_CASE("Detection request validation", "[request][detection]") {
    DetectionSettings settings;
    DetectionRequest req;
    std::string error;

    SECTION("Valid text is trimmed") {
        REQUIRE(DetectionRequest::parse(json{{"text", "  " + kLongText + "\n"}}, settings, req, error));
        REQUIRE(req.text == kLongText);
    }

    SECTION("Missing text") {
        REQUIRE_FALSE(DetectionRequest::parse(json::object(), settings, req, error));
        REQUIRE(error == "No text provided");
    }

    SECTION("Whitespace-only text") {
        REQUIRE_FALSE(DetectionRequest::parse(json{{"text", "   \t "}}, settings, req, error));
        REQUIRE(error == "No text provided");
    }

    SECTION("Too short after trimming") {
        REQUIRE_FALSE(DetectionRequest::parse(json{{"text", "  short text  "}}, settings, req, error));
        REQUIRE(error == "Text must be at least 50 characters");
    }

    SECTION("Length counts code points, not bytes") {
        std::string accented;
        for (int i = 0; i < 30; ++i)
            accented += "\xC3\xA9"; // 30 code points, 60 bytes
        REQUIRE_FALSE(DetectionRequest::parse(json{{"text", accented}}, settings, req, error));
    }

    SECTION("Wrong type") {
        REQUIRE_FALSE(DetectionRequest::parse(json{{"text", 42}}, settings, req, error));
        REQUIRE(error == "'text' must be a string");
    }

    SECTION("Body must be an object") {
        REQUIRE_FALSE(DetectionRequest::parse(json::array(), settings, req, error));
    }
}

TEST_CASE("Generation request validation", "[request][generation]") {
    GenerationSettings settings;
    GenerationRequest req;
    std::string error;

    SECTION("Defaults") {
        REQUIRE(GenerationRequest::parse(json{{"prompt", " Tell me about oceans "}}, settings, req, error));
        REQUIRE(req.prompt == "Tell me about oceans");
        REQUIRE(req.tone == Tone::Formal);
        REQUIRE(req.max_length == 500);
        REQUIRE_THAT(req.temperature, WithinAbs(0.7, 1e-12));
    }

    SECTION("Explicit values") {
        json body{{"prompt", "p"}, {"tone", "creative"}, {"maxLength", 1000}, {"temperature", 0.1}};
        REQUIRE(GenerationRequest::parse(body, settings, req, error));
        REQUIRE(req.tone == Tone::Creative);
        REQUIRE(req.max_length == 1000);
    }

    SECTION("Numbers sent as strings") {
        json body{{"prompt", "p"}, {"maxLength", "250"}, {"temperature", "0.5"}};
        REQUIRE(GenerationRequest::parse(body, settings, req, error));
        REQUIRE(req.max_length == 250);
        REQUIRE_THAT(req.temperature, WithinAbs(0.5, 1e-12));
    }

    SECTION("Unknown tone is neutral") {
        REQUIRE(GenerationRequest::parse(json{{"prompt", "p"}, {"tone", "pirate"}}, settings, req, error));
        REQUIRE(req.tone == Tone::Neutral);
    }

    SECTION("Missing prompt") {
        REQUIRE_FALSE(GenerationRequest::parse(json{{"prompt", "  "}}, settings, req, error));
        REQUIRE(error == "No prompt provided");
    }

    SECTION("maxLength out of range") {
        REQUIRE_FALSE(GenerationRequest::parse(json{{"prompt", "p"}, {"maxLength", 99}}, settings, req, error));
        REQUIRE(error.find("maxLength") != std::string::npos);
        REQUIRE_FALSE(GenerationRequest::parse(json{{"prompt", "p"}, {"maxLength", 1001}}, settings, req, error));
    }

    SECTION("temperature out of range") {
        REQUIRE_FALSE(GenerationRequest::parse(json{{"prompt", "p"}, {"temperature", 0.05}}, settings, req, error));
        REQUIRE(error.find("temperature") != std::string::npos);
        REQUIRE_FALSE(GenerationRequest::parse(json{{"prompt", "p"}, {"temperature", 1.5}}, settings, req, error));
    }

    SECTION("Non-numeric maxLength") {
        REQUIRE_FALSE(GenerationRequest::parse(json{{"prompt", "p"}, {"maxLength", "lots"}}, settings, req, error));
        REQUIRE(error == "'maxLength' must be a number");
    }
}

TEST_CASE("Summarization request validation", "[request][summarization]") {
    SummarizationSettings settings;
    SummarizationRequest req;
    std::string error;

    SECTION("Defaults") {
        REQUIRE(SummarizationRequest::parse(json{{"text", "Some text."}}, settings, req, error));
        REQUIRE_THAT(req.ratio, WithinAbs(0.5, 1e-12));
        REQUIRE(req.format == SummaryFormat::Paragraph);
    }

    SECTION("Bullets") {
        REQUIRE(SummarizationRequest::parse(json{{"text", "t"}, {"ratio", 0.25}, {"format", "bullets"}}, settings,
                                            req, error));
        REQUIRE(req.format == SummaryFormat::Bullets);
        REQUIRE_THAT(req.ratio, WithinAbs(0.25, 1e-12));
    }

    SECTION("Invalid ratio and format") {
        REQUIRE_FALSE(SummarizationRequest::parse(json{{"text", "t"}, {"ratio", 1.5}}, settings, req, error));
        REQUIRE(error.find("ratio") != std::string::npos);
        REQUIRE_FALSE(SummarizationRequest::parse(json{{"text", "t"}, {"format", "table"}}, settings, req, error));
        REQUIRE(error.find("format") != std::string::npos);
    }

    SECTION("Missing text") {
        REQUIRE_FALSE(SummarizationRequest::parse(json{{"ratio", 0.5}}, settings, req, error));
        REQUIRE(error == "No text provided");
    }
}

TEST_CASE("parseRequest selects the request kind", "[request]") {
    AnalysisSettings settings;
    AnalysisRequest req;
    std::string error;

    REQUIRE(parseRequest(RequestKind::Detection, json{{"text", kLongText}}, settings, req, error));
    REQUIRE(kindOf(req) == RequestKind::Detection);
    REQUIRE(std::holds_alternative<DetectionRequest>(req));

    REQUIRE(parseRequest(RequestKind::Summarization, json{{"text", "t"}}, settings, req, error));
    REQUIRE(kindOf(req) == RequestKind::Summarization);

    REQUIRE(parseRequest(RequestKind::Generation, json{{"prompt", "p"}}, settings, req, error));
    REQUIRE(kindOf(req) == RequestKind::Generation);

    REQUIRE_FALSE(parseRequest(RequestKind::Generation, json{{"text", "t"}}, settings, req, error));
    REQUIRE(error == "No prompt provided");
}
