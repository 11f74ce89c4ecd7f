#pragma once

#include "HttpOracleBase.hpp"
#include "IClassifierOracle.hpp"

namespace oracle
{

// Sequence classifier reached through /tokenize and /classify.
class HttpClassifierOracle : public IClassifierOracle, public HttpOracleBase
{
public:
    HttpClassifierOracle() = default;
    ~HttpClassifierOracle() override = default;

    EncodedInput encode(const std::string& text, std::size_t max_tokens = kDefaultMaxInputTokens,
                        bool truncate = true) override;
    ClassifierOutput classify(const EncodedInput& input) override;
    void shutdown() override { stop(); }

protected:
    const char* providerName() const override;
};

} // namespace oracle
