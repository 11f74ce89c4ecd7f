#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace analysis
{

enum class RequestKind
{
    Detection,
    Summarization,
    Generation
};

enum class Tone
{
    Formal,
    Casual,
    Creative,
    Technical,
    Neutral // unrecognized tone; no instruction prefix
};

enum class SummaryFormat
{
    Paragraph,
    Bullets
};

// isAI always equals (confidence > threshold) on the rounded confidence.
struct DetectionResult
{
    bool is_ai = false;
    double confidence = 50.0;
    double perplexity = 0.0;
    double burstiness = 0.0;
    std::optional<std::string> error;
};

struct GenerationResult
{
    std::string generated_text;
    std::size_t word_count = 0;
    std::size_t tokens_used = 0;
    std::optional<std::string> error;
};

struct SummaryResult
{
    std::string summary;
    std::size_t original_words = 0;
    std::size_t summary_words = 0;
    double compression_ratio = 0.0;
    std::optional<std::string> error;
};

// Record type names used in the persisted log ("detection", "summary", "generation").
const char* recordType(RequestKind kind);

nlohmann::json toJson(const DetectionResult& result);
nlohmann::json toJson(const GenerationResult& result);
nlohmann::json toJson(const SummaryResult& result);

// Rounds half away from zero to two decimals.
double roundTo2(double value);

} // namespace analysis
