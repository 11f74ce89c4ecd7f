#pragma once

#include "oracle/IClassifierOracle.hpp"
#include "oracle/IGeneratorOracle.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace test_utils {

// Classifier returning fixed logits. Tokens are one per byte of input.
class FakeClassifier : public oracle::IClassifierOracle {
public:
    explicit FakeClassifier(std::vector<double> logits = {0.0, 0.0}) : logits_(std::move(logits)) {}

    oracle::EncodedInput encode(const std::string& text, std::size_t max_tokens, bool truncate) override
    {
        ++encode_calls;
        last_text = text;
        last_max_tokens = max_tokens;
        if (throw_on_encode)
            throw oracle::OracleError("tokenizer unavailable");
        oracle::EncodedInput in;
        for (std::size_t i = 0; i < text.size() && (!truncate || i < max_tokens); ++i)
            in.token_ids.push_back(static_cast<std::int32_t>(static_cast<unsigned char>(text[i])));
        in.truncated = truncate && text.size() > max_tokens;
        return in;
    }

    oracle::ClassifierOutput classify(const oracle::EncodedInput&) override
    {
        ++classify_calls;
        if (throw_on_classify)
            throw oracle::OracleError("classifier backend down");
        if (throw_foreign_on_classify)
            throw 42;
        return {logits_};
    }

    void setLogits(std::vector<double> logits) { logits_ = std::move(logits); }

    bool throw_on_encode = false;
    bool throw_on_classify = false;
    bool throw_foreign_on_classify = false; // throws an int, not a std::exception
    std::atomic<int> encode_calls{0};
    std::atomic<int> classify_calls{0};
    std::string last_text;
    std::size_t last_max_tokens = 0;

private:
    std::vector<double> logits_;
};

// Generator whose decode() returns a scripted string. With echo_prompt set the
// encoded prompt is returned in front of the scripted continuation, like a
// causal model that includes its input in the output sequence.
class FakeGenerator : public oracle::IGeneratorOracle {
public:
    explicit FakeGenerator(std::string continuation = {}) : continuation_(std::move(continuation)) {}

    oracle::EncodedInput encode(const std::string& text, std::size_t max_tokens, bool) override
    {
        last_prompt = text;
        last_max_tokens = max_tokens;
        if (throw_on_encode)
            throw oracle::OracleError("tokenizer unavailable");
        oracle::EncodedInput in;
        in.token_ids.assign(prompt_tokens, 1);
        return in;
    }

    oracle::SampleOutput sampleDecode(const oracle::EncodedInput& input, const oracle::SamplingPolicy& policy) override
    {
        last_policy = policy;
        if (throw_on_sample)
            throw oracle::OracleError("generation timed out");
        if (throw_foreign_on_sample)
            throw 42;
        oracle::SampleOutput out;
        out.token_sequence = input.token_ids;
        out.token_sequence.insert(out.token_sequence.end(), continuation_tokens, 2);
        out.total_token_count = out.token_sequence.size();
        return out;
    }

    std::string decode(const std::vector<std::int32_t>&) override
    {
        if (throw_on_decode)
            throw oracle::OracleError("detokenizer unavailable");
        return echo_prompt ? last_prompt + continuation_ : continuation_;
    }

    void setContinuation(std::string text) { continuation_ = std::move(text); }

    bool echo_prompt = false;
    bool throw_on_encode = false;
    bool throw_on_sample = false;
    bool throw_foreign_on_sample = false;
    bool throw_on_decode = false;
    std::size_t prompt_tokens = 8;
    std::size_t continuation_tokens = 40;
    std::string last_prompt;
    std::size_t last_max_tokens = 0;
    std::optional<oracle::SamplingPolicy> last_policy;

private:
    std::string continuation_;
};

} // namespace test_utils
