#include "DetectionOrchestrator.hpp"

#include "../processing/StageRunner.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <cmath>

namespace analysis
{

DetectionOrchestrator::DetectionOrchestrator(oracle::IClassifierOracle& classifier, DetectionSettings settings)
    : classifier_(classifier)
    , settings_(settings)
{
}

DetectionResult DetectionOrchestrator::fallback(const std::string& error)
{
    DetectionResult result;
    result.is_ai = false;
    result.confidence = 50.0;
    result.perplexity = 0.0;
    result.burstiness = 0.0;
    result.error = error;
    return result;
}

DetectionResult DetectionOrchestrator::detect(const std::string& text) const
{
    PROFILE_SCOPE_FUNCTION();

    auto classified = processing::run_stage<std::vector<double>>("classify", [&] {
        auto encoded = classifier_.encode(text, settings_.max_input_tokens, true);
        auto logits = classifier_.classify(encoded).logits;
        if (logits.size() != 2)
            throw oracle::OracleError("classifier returned " + std::to_string(logits.size()) +
                                      " logits, expected 2");
        for (double l : logits)
        {
            if (!std::isfinite(l))
                throw oracle::OracleError("classifier returned a non-finite logit");
        }
        return logits;
    });
    if (!classified.ok())
        return fallback(classified.error);

    const auto& logits = *classified.value;
    const auto probs = HeuristicsEngine::softmax(logits);
    const std::size_t ai_index = settings_.ai_label_index < probs.size() ? settings_.ai_label_index : 1;

    DetectionResult result;
    result.confidence = roundTo2(probs[ai_index] * 100.0);
    result.perplexity = roundTo2(HeuristicsEngine::perplexityFromLogits(logits));
    result.burstiness = roundTo2(HeuristicsEngine::burstiness(text));
    result.is_ai = result.confidence > settings_.threshold;

    PLOG_INFO << "Detection: isAI=" << result.is_ai << " confidence=" << result.confidence
              << " perplexity=" << result.perplexity << " burstiness=" << result.burstiness;
    return result;
}

} // namespace analysis
