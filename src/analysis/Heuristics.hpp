#pragma once

#include "../oracle/IClassifierOracle.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace analysis
{

/**
 * @brief Stylometric scores that complement the classifier verdict.
 *
 * perplexityProxy() asks the classifier oracle for logits and turns them into a
 * bounded pseudo-perplexity; it is not a language-model perplexity. burstiness()
 * is purely lexical. Neither keeps state between calls.
 */
class HeuristicsEngine
{
public:
    static constexpr double kMaxPerplexity = 100.0;

    explicit HeuristicsEngine(oracle::IClassifierOracle& classifier,
                              std::size_t max_input_tokens = oracle::kDefaultMaxInputTokens);

    // Encodes and classifies `text`; any oracle failure yields 0.0.
    double perplexityProxy(const std::string& text) const;

    // exp(logsumexp(logits) - logits[0]) clipped to [0, kMaxPerplexity]; 0.0 for empty or non-finite input.
    static double perplexityFromLogits(const std::vector<double>& logits);

    // Coefficient of variation of per-sentence word counts, clipped to [0, 1].
    static double burstiness(std::string_view text);

    // Numerically stable softmax.
    static std::vector<double> softmax(const std::vector<double>& logits);

private:
    oracle::IClassifierOracle& classifier_;
    std::size_t max_input_tokens_;
};

} // namespace analysis
