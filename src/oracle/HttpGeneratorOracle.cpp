#include "HttpGeneratorOracle.hpp"

#include <plog/Log.h>

namespace oracle
{

HttpGeneratorOracle::HttpGeneratorOracle(std::string name)
    : name_(std::move(name))
{
}

const char* HttpGeneratorOracle::providerName() const
{
    return name_.c_str();
}

EncodedInput HttpGeneratorOracle::encode(const std::string& text, std::size_t max_tokens, bool truncate)
{
    return tokenize(text, max_tokens, truncate);
}

nlohmann::json HttpGeneratorOracle::buildGenerateBody(const EncodedInput& input, const SamplingPolicy& policy)
{
    nlohmann::json body;
    body["tokens"] = input.token_ids;
    body["max_length"] = policy.maxLength();
    body["min_length"] = policy.minLength();
    body["temperature"] = policy.temperature();
    body["top_k"] = policy.topK();
    body["top_p"] = policy.topP();
    body["no_repeat_ngram_size"] = policy.noRepeatNgramSize();
    body["num_return_sequences"] = policy.numReturnSequences();
    body["do_sample"] = policy.doSample();
    if (policy.seed())
        body["seed"] = *policy.seed();
    return body;
}

SampleOutput HttpGeneratorOracle::sampleDecode(const EncodedInput& input, const SamplingPolicy& policy)
{
    if (input.token_ids.empty())
        fail("sampleDecode called with empty input");

    const auto response = postEndpoint("/generate", buildGenerateBody(input, policy));
    if (!response.contains("sequences") || !response["sequences"].is_array() || response["sequences"].empty())
        fail("missing sequences in /generate response");

    SampleOutput out;
    try
    {
        out.token_sequence = parseTokenArray(response["sequences"][0], "sequences[0]");
    }
    catch (const OracleError& ex)
    {
        fail(ex.what());
    }
    out.total_token_count = out.token_sequence.size();

    PLOG_DEBUG << name_ << " sampled " << out.total_token_count << " tokens (prompt " << input.token_ids.size()
               << ", max_length " << policy.maxLength() << ")";
    return out;
}

std::string HttpGeneratorOracle::decode(const std::vector<std::int32_t>& token_sequence)
{
    return detokenize(token_sequence);
}

} // namespace oracle
