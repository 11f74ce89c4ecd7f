#include "HttpClassifierOracle.hpp"

#include <plog/Log.h>

namespace oracle
{

const char* HttpClassifierOracle::providerName() const
{
    return "Classifier";
}

EncodedInput HttpClassifierOracle::encode(const std::string& text, std::size_t max_tokens, bool truncate)
{
    return tokenize(text, max_tokens, truncate);
}

ClassifierOutput HttpClassifierOracle::classify(const EncodedInput& input)
{
    if (input.token_ids.empty())
        fail("classify called with empty input");

    const auto response = postEndpoint("/classify", nlohmann::json{ { "tokens", input.token_ids } });
    if (!response.contains("logits"))
        fail("missing logits in /classify response");

    // Batched servers answer [[a, b]]; take the single row.
    const nlohmann::json* row = &response["logits"];
    if (row->is_array() && !row->empty() && (*row)[0].is_array())
        row = &(*row)[0];
    if (!row->is_array())
        fail("logits is not an array");

    ClassifierOutput out;
    out.logits.reserve(row->size());
    for (const auto& value : *row)
    {
        if (!value.is_number())
            fail("non-numeric logit in /classify response");
        out.logits.push_back(value.get<double>());
    }

    PLOG_DEBUG << "classifier logits count=" << out.logits.size() << " tokens=" << input.token_ids.size();
    return out;
}

} // namespace oracle
