#include "AnalysisTypes.hpp"

#include <cmath>

namespace analysis
{

const char* recordType(RequestKind kind)
{
    switch (kind)
    {
    case RequestKind::Detection:
        return "detection";
    case RequestKind::Summarization:
        return "summary";
    case RequestKind::Generation:
        return "generation";
    }
    return "unknown";
}

double roundTo2(double value)
{
    return std::round(value * 100.0) / 100.0;
}

nlohmann::json toJson(const DetectionResult& result)
{
    nlohmann::json j = {
        { "isAI", result.is_ai },
        { "confidence", result.confidence },
        { "perplexity", result.perplexity },
        { "burstiness", result.burstiness },
    };
    if (result.error)
        j["error"] = *result.error;
    return j;
}

nlohmann::json toJson(const GenerationResult& result)
{
    nlohmann::json j = {
        { "generatedText", result.generated_text },
        { "wordCount", result.word_count },
        { "tokensUsed", result.tokens_used },
    };
    if (result.error)
        j["error"] = *result.error;
    return j;
}

nlohmann::json toJson(const SummaryResult& result)
{
    nlohmann::json j = {
        { "summary", result.summary },
        { "originalWords", result.original_words },
        { "summaryWords", result.summary_words },
        { "compressionRatio", result.compression_ratio },
    };
    if (result.error)
        j["error"] = *result.error;
    return j;
}

} // namespace analysis
