#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace oracle
{

// Token window used by the upstream models when the caller does not override it.
constexpr std::size_t kDefaultMaxInputTokens = 512;

// Raised by every oracle operation on backend, transport or protocol failure.
class OracleError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct EncodedInput
{
    std::vector<std::int32_t> token_ids;
    bool truncated = false;
};

struct ClassifierOutput
{
    std::vector<double> logits;
};

struct SampleOutput
{
    std::vector<std::int32_t> token_sequence; // prompt + continuation
    std::size_t total_token_count = 0;
};

} // namespace oracle
