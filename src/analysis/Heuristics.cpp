#include "Heuristics.hpp"

#include "../processing/StageRunner.hpp"
#include "../processing/TextUtils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace analysis
{

HeuristicsEngine::HeuristicsEngine(oracle::IClassifierOracle& classifier, std::size_t max_input_tokens)
    : classifier_(classifier)
    , max_input_tokens_(max_input_tokens)
{
}

double HeuristicsEngine::perplexityProxy(const std::string& text) const
{
    auto stage = processing::run_stage<std::vector<double>>("perplexity_proxy", [&] {
        auto encoded = classifier_.encode(text, max_input_tokens_, true);
        return classifier_.classify(encoded).logits;
    });
    if (!stage.ok())
        return 0.0;
    return perplexityFromLogits(*stage.value);
}

double HeuristicsEngine::perplexityFromLogits(const std::vector<double>& logits)
{
    if (logits.empty())
        return 0.0;

    const double max_logit = *std::max_element(logits.begin(), logits.end());
    if (!std::isfinite(max_logit))
        return 0.0;

    double sum = 0.0;
    for (double l : logits)
        sum += std::exp(l - max_logit);
    const double loss = max_logit + std::log(sum) - logits.front();

    const double proxy = std::exp(loss);
    if (std::isnan(proxy))
        return 0.0;
    return std::clamp(proxy, 0.0, kMaxPerplexity);
}

double HeuristicsEngine::burstiness(std::string_view text)
{
    std::vector<std::size_t> lengths;
    std::size_t start = 0;
    while (start <= text.size())
    {
        auto end = text.find('.', start);
        if (end == std::string_view::npos)
            end = text.size();
        const auto sentence = processing::trim(text.substr(start, end - start));
        if (!sentence.empty())
            lengths.push_back(processing::countWords(sentence));
        start = end + 1;
    }

    if (lengths.size() < 2)
        return 0.0;

    const double n = static_cast<double>(lengths.size());
    const double mean = std::accumulate(lengths.begin(), lengths.end(), 0.0) / n;
    if (mean == 0.0)
        return 0.0;

    double variance = 0.0;
    for (auto len : lengths)
    {
        const double d = static_cast<double>(len) - mean;
        variance += d * d;
    }
    variance /= n;

    return std::clamp(std::sqrt(variance) / mean, 0.0, 1.0);
}

std::vector<double> HeuristicsEngine::softmax(const std::vector<double>& logits)
{
    std::vector<double> probs(logits.size(), 0.0);
    if (logits.empty())
        return probs;

    const double max_logit = *std::max_element(logits.begin(), logits.end());
    double sum = 0.0;
    for (std::size_t i = 0; i < logits.size(); ++i)
    {
        probs[i] = std::exp(logits[i] - max_logit);
        sum += probs[i];
    }
    for (auto& p : probs)
        p /= sum;
    return probs;
}

} // namespace analysis
