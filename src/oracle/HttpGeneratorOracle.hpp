#pragma once

#include "HttpOracleBase.hpp"
#include "IGeneratorOracle.hpp"

namespace oracle
{

// Causal generator reached through /tokenize, /generate and /detokenize.
class HttpGeneratorOracle : public IGeneratorOracle, public HttpOracleBase
{
public:
    // name distinguishes the generator and summarizer instances in logs.
    explicit HttpGeneratorOracle(std::string name = "Generator");
    ~HttpGeneratorOracle() override = default;

    EncodedInput encode(const std::string& text, std::size_t max_tokens = kDefaultMaxInputTokens,
                        bool truncate = true) override;
    SampleOutput sampleDecode(const EncodedInput& input, const SamplingPolicy& policy) override;
    std::string decode(const std::vector<std::int32_t>& token_sequence) override;
    void shutdown() override { stop(); }

    static nlohmann::json buildGenerateBody(const EncodedInput& input, const SamplingPolicy& policy);

protected:
    const char* providerName() const override;

private:
    std::string name_;
};

} // namespace oracle
