#pragma once

#include "AnalysisSettings.hpp"
#include "AnalysisTypes.hpp"
#include "../oracle/IGeneratorOracle.hpp"

#include <string>

namespace analysis
{

/**
 * @brief Tone-conditioned text generation with output repair.
 *
 * The prompt is prefixed with the tone instruction, sampled with a policy
 * built from the request, and the decoded text is stripped of any echoed
 * prompt, whitespace-collapsed and cut back to its last complete sentence.
 * generate() never throws; failures yield the apology fallback.
 */
class GenerationOrchestrator
{
public:
    static constexpr const char* kFallbackText = "Error generating text. Please try with a different prompt.";

    explicit GenerationOrchestrator(oracle::IGeneratorOracle& generator, GenerationSettings settings = {});

    GenerationResult generate(const std::string& prompt, Tone tone, int max_length, double temperature) const;

    // round(max_length * words_to_tokens_ratio)
    int tokenBudget(int max_length) const;
    oracle::SamplingPolicy buildPolicy(int max_length, double temperature) const;

    static GenerationResult fallback(const std::string& error);

    const GenerationSettings& settings() const { return settings_; }

private:
    struct RawGeneration
    {
        std::string text;
        std::size_t tokens_used = 0;
    };

    oracle::IGeneratorOracle& generator_;
    GenerationSettings settings_;
};

} // namespace analysis
