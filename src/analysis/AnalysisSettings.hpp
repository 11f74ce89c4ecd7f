#pragma once

#include "../oracle/OracleTypes.hpp"
#include "../oracle/SamplingPolicy.hpp"

#include <cstddef>
#include <string>

namespace analysis
{

struct DetectionSettings
{
    std::size_t min_chars = 50;       // code points, after trimming
    double threshold = 50.0;          // isAI iff confidence > threshold
    std::size_t ai_label_index = 1;   // classifier output index of the "AI" class
    std::size_t max_input_tokens = oracle::kDefaultMaxInputTokens;
};

struct GenerationSettings
{
    double words_to_tokens_ratio = 1.3;
    oracle::SamplingDefaults sampling;
    std::size_t max_input_tokens = oracle::kDefaultMaxInputTokens;
    std::string default_tone = "formal";
    int default_max_length = 500;
    double default_temperature = 0.7;
};

struct SummarizationSettings
{
    double default_ratio = 0.5;
    int min_summary_words = 20;
    int min_length = 30;
    double temperature = 0.7;
    std::size_t max_input_tokens = 1024;
};

struct AnalysisSettings
{
    DetectionSettings detection;
    GenerationSettings generation;
    SummarizationSettings summarization;
};

} // namespace analysis
