#include "SummarizationOrchestrator.hpp"

#include "TextRepair.hpp"
#include "../processing/StageRunner.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cmath>

namespace analysis
{

SummarizationOrchestrator::SummarizationOrchestrator(oracle::IGeneratorOracle& summarizer,
                                                     SummarizationSettings summarization,
                                                     GenerationSettings generation)
    : summarizer_(summarizer)
    , settings_(summarization)
    , generation_(std::move(generation))
{
}

int SummarizationOrchestrator::targetWords(std::size_t original_words, double ratio) const
{
    const auto scaled = static_cast<int>(std::lround(static_cast<double>(original_words) * ratio));
    return std::max(settings_.min_summary_words, scaled);
}

oracle::SamplingPolicy SummarizationOrchestrator::buildPolicy(int target_words) const
{
    const int max_tokens =
        static_cast<int>(std::lround(static_cast<double>(target_words) * generation_.words_to_tokens_ratio));
    auto defaults = generation_.sampling;
    defaults.min_length = std::min(settings_.min_length, max_tokens);
    return oracle::SamplingPolicy(max_tokens, settings_.temperature, defaults);
}

SummaryResult SummarizationOrchestrator::fallback(std::size_t original_words, const std::string& error)
{
    SummaryResult result;
    result.summary = kFallbackText;
    result.original_words = original_words;
    result.summary_words = 0;
    result.compression_ratio = 0.0;
    result.error = error;
    return result;
}

SummaryResult SummarizationOrchestrator::summarize(const std::string& text, double ratio,
                                                   SummaryFormat format) const
{
    PROFILE_SCOPE_FUNCTION();

    const std::size_t original_words = processing::countWords(text);
    const auto policy = buildPolicy(targetWords(original_words, ratio));

    auto sampled = processing::run_stage<RawSummary>("summarize", [&] {
        auto encoded = summarizer_.encode(text, settings_.max_input_tokens, true);
        auto output = summarizer_.sampleDecode(encoded, policy);
        return RawSummary{ summarizer_.decode(output.token_sequence) };
    });
    if (!sampled.ok())
        return fallback(original_words, sampled.error);

    std::string repaired = repairText(stripEchoedPrompt(sampled.value->text, text));

    SummaryResult result;
    result.original_words = original_words;
    result.summary_words = processing::countWords(repaired);
    result.summary = format == SummaryFormat::Bullets ? formatBullets(splitSentences(repaired)) : repaired;
    result.compression_ratio =
        original_words == 0 ? 0.0 : roundTo2(static_cast<double>(result.summary_words) / original_words);

    PLOG_INFO << "Summary: " << original_words << " -> " << result.summary_words << " words (ratio "
              << result.compression_ratio << ")";
    return result;
}

} // namespace analysis
