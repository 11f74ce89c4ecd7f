#include "ToneTemplate.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace analysis
{

namespace
{

constexpr std::array<std::pair<Tone, std::string_view>, 4> kTonePrefixes{ {
    { Tone::Formal, "Write in a formal, professional manner: " },
    { Tone::Casual, "Write in a casual, conversational style: " },
    { Tone::Creative, "Write creatively and imaginatively: " },
    { Tone::Technical, "Write in a technical, precise manner: " },
} };

} // namespace

std::string_view tonePrefix(Tone tone)
{
    for (const auto& [key, prefix] : kTonePrefixes)
    {
        if (key == tone)
            return prefix;
    }
    return {};
}

Tone parseTone(std::string_view name)
{
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "formal")
        return Tone::Formal;
    if (lower == "casual")
        return Tone::Casual;
    if (lower == "creative")
        return Tone::Creative;
    if (lower == "technical")
        return Tone::Technical;
    return Tone::Neutral;
}

const char* toneName(Tone tone)
{
    switch (tone)
    {
    case Tone::Formal:
        return "formal";
    case Tone::Casual:
        return "casual";
    case Tone::Creative:
        return "creative";
    case Tone::Technical:
        return "technical";
    case Tone::Neutral:
        return "neutral";
    }
    return "neutral";
}

std::string conditionPrompt(std::string_view prompt, Tone tone)
{
    std::string full(tonePrefix(tone));
    full.append(prompt);
    return full;
}

} // namespace analysis
