#pragma once

#include "OracleTypes.hpp"
#include "SamplingPolicy.hpp"

#include <string>
#include <vector>

namespace oracle
{

// Causal generative model. Also used for summarization, which has the same call shape.
class IGeneratorOracle
{
public:
    virtual ~IGeneratorOracle() = default;

    virtual EncodedInput encode(const std::string& text, std::size_t max_tokens = kDefaultMaxInputTokens,
                                bool truncate = true) = 0;
    virtual SampleOutput sampleDecode(const EncodedInput& input, const SamplingPolicy& policy) = 0;
    virtual std::string decode(const std::vector<std::int32_t>& token_sequence) = 0;

    virtual void shutdown() {}
};

} // namespace oracle
