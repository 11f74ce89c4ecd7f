#pragma once

#include <cstdint>
#include <optional>

namespace oracle
{

// Decode settings shared by every sampling call; loaded from [generation].
struct SamplingDefaults
{
    int top_k = 50;
    double top_p = 0.95;
    int no_repeat_ngram_size = 3;
    int min_length = 50;
    int num_return_sequences = 1;
    std::optional<std::uint64_t> seed;
};

/**
 * @brief Immutable sampling configuration for a single sampleDecode call.
 *
 * Built once per request from the caller-supplied length and temperature plus
 * the process-wide defaults. Sampling is always stochastic (do_sample); a seed
 * is only forwarded when one is configured.
 */
class SamplingPolicy
{
public:
    SamplingPolicy(int max_length, double temperature, const SamplingDefaults& defaults = {})
        : max_length_(max_length)
        , min_length_(defaults.min_length)
        , temperature_(temperature)
        , top_k_(defaults.top_k)
        , top_p_(defaults.top_p)
        , no_repeat_ngram_size_(defaults.no_repeat_ngram_size)
        , num_return_sequences_(defaults.num_return_sequences)
        , seed_(defaults.seed)
    {
    }

    int maxLength() const { return max_length_; }
    int minLength() const { return min_length_; }
    double temperature() const { return temperature_; }
    int topK() const { return top_k_; }
    double topP() const { return top_p_; }
    int noRepeatNgramSize() const { return no_repeat_ngram_size_; }
    int numReturnSequences() const { return num_return_sequences_; }
    bool doSample() const { return true; }
    const std::optional<std::uint64_t>& seed() const { return seed_; }

private:
    int max_length_;
    int min_length_;
    double temperature_;
    int top_k_;
    double top_p_;
    int no_repeat_ngram_size_;
    int num_return_sequences_;
    std::optional<std::uint64_t> seed_;
};

} // namespace oracle
