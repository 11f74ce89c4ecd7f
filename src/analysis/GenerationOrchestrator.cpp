#include "GenerationOrchestrator.hpp"

#include "TextRepair.hpp"
#include "ToneTemplate.hpp"
#include "../processing/Diagnostics.hpp"
#include "../processing/StageRunner.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <cmath>

namespace analysis
{

GenerationOrchestrator::GenerationOrchestrator(oracle::IGeneratorOracle& generator, GenerationSettings settings)
    : generator_(generator)
    , settings_(std::move(settings))
{
}

int GenerationOrchestrator::tokenBudget(int max_length) const
{
    return static_cast<int>(std::lround(static_cast<double>(max_length) * settings_.words_to_tokens_ratio));
}

oracle::SamplingPolicy GenerationOrchestrator::buildPolicy(int max_length, double temperature) const
{
    return oracle::SamplingPolicy(tokenBudget(max_length), temperature, settings_.sampling);
}

GenerationResult GenerationOrchestrator::fallback(const std::string& error)
{
    GenerationResult result;
    result.generated_text = kFallbackText;
    result.word_count = 0;
    result.tokens_used = 0;
    result.error = error;
    return result;
}

GenerationResult GenerationOrchestrator::generate(const std::string& prompt, Tone tone, int max_length,
                                                  double temperature) const
{
    PROFILE_SCOPE_FUNCTION();

    const std::string full_prompt = conditionPrompt(prompt, tone);
    const auto policy = buildPolicy(max_length, temperature);

    auto sampled = processing::run_stage<RawGeneration>("sample_decode", [&] {
        auto encoded = generator_.encode(full_prompt, settings_.max_input_tokens, true);
        auto output = generator_.sampleDecode(encoded, policy);
        RawGeneration raw;
        raw.text = generator_.decode(output.token_sequence);
        raw.tokens_used = output.total_token_count;
        return raw;
    });
    if (!sampled.ok())
        return fallback(sampled.error);

    auto repaired = processing::run_stage<std::string>(
        "repair", [&] { return repairText(stripEchoedPrompt(sampled.value->text, full_prompt)); },
        utils::ErrorCategory::Unknown);
    if (!repaired.ok())
        return fallback(repaired.error);

    GenerationResult result;
    result.generated_text = std::move(*repaired.value);
    result.word_count = processing::countWords(result.generated_text);
    result.tokens_used = sampled.value->tokens_used;

    PLOG_INFO << "Generation: tone=" << toneName(tone) << " budget=" << policy.maxLength()
              << " words=" << result.word_count << " tokens=" << result.tokens_used;
    if (processing::Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
            << "generated: " << processing::Diagnostics::Preview(result.generated_text);
    }
    return result;
}

} // namespace analysis
