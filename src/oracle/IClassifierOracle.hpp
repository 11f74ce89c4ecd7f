#pragma once

#include "OracleTypes.hpp"

#include <string>

namespace oracle
{

// Sequence classifier (human vs. AI). Implementations must tolerate concurrent calls.
class IClassifierOracle
{
public:
    virtual ~IClassifierOracle() = default;

    virtual EncodedInput encode(const std::string& text, std::size_t max_tokens = kDefaultMaxInputTokens,
                                bool truncate = true) = 0;
    virtual ClassifierOutput classify(const EncodedInput& input) = 0;

    // Aborts in-flight calls; later calls fail with OracleError.
    virtual void shutdown() {}
};

} // namespace oracle
