#pragma once

#include "AnalysisSettings.hpp"
#include "AnalysisTypes.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

namespace analysis
{

// Each parse() fills `out` and returns true, or leaves a client-facing message in
// `error` and returns false. Text fields are trimmed.

struct DetectionRequest
{
    std::string text;

    static bool parse(const nlohmann::json& body, const DetectionSettings& settings, DetectionRequest& out,
                      std::string& error);
};

struct SummarizationRequest
{
    static constexpr double kMinRatio = 0.1;
    static constexpr double kMaxRatio = 0.9;

    std::string text;
    double ratio = 0.5;
    SummaryFormat format = SummaryFormat::Paragraph;

    static bool parse(const nlohmann::json& body, const SummarizationSettings& settings, SummarizationRequest& out,
                      std::string& error);
};

struct GenerationRequest
{
    static constexpr int kMinMaxLength = 100;
    static constexpr int kMaxMaxLength = 1000;
    static constexpr double kMinTemperature = 0.1;
    static constexpr double kMaxTemperature = 1.0;

    std::string prompt;
    Tone tone = Tone::Formal;
    int max_length = 500;
    double temperature = 0.7;

    static bool parse(const nlohmann::json& body, const GenerationSettings& settings, GenerationRequest& out,
                      std::string& error);
};

using AnalysisRequest = std::variant<DetectionRequest, SummarizationRequest, GenerationRequest>;

RequestKind kindOf(const AnalysisRequest& request);

// Dispatches to the parse() of the given kind.
bool parseRequest(RequestKind kind, const nlohmann::json& body, const AnalysisSettings& settings,
                  AnalysisRequest& out, std::string& error);

} // namespace analysis
