#pragma once

#include "AnalysisSettings.hpp"
#include "AnalysisTypes.hpp"
#include "../oracle/IGeneratorOracle.hpp"

#include <string>

namespace analysis
{

// Length-targeted summarization over a generator-shaped oracle. Never throws.
class SummarizationOrchestrator
{
public:
    static constexpr const char* kFallbackText = "Error generating summary. Please try again.";

    SummarizationOrchestrator(oracle::IGeneratorOracle& summarizer, SummarizationSettings summarization = {},
                              GenerationSettings generation = {});

    SummaryResult summarize(const std::string& text, double ratio, SummaryFormat format) const;

    // max(min_summary_words, round(original_words * ratio))
    int targetWords(std::size_t original_words, double ratio) const;
    oracle::SamplingPolicy buildPolicy(int target_words) const;

    static SummaryResult fallback(std::size_t original_words, const std::string& error);

private:
    struct RawSummary
    {
        std::string text;
    };

    oracle::IGeneratorOracle& summarizer_;
    SummarizationSettings settings_;
    GenerationSettings generation_;
};

} // namespace analysis
