#pragma once

#include "AnalysisTypes.hpp"

#include <string>
#include <string_view>

namespace analysis
{

// Instruction prepended to a prompt for the given tone; empty for Tone::Neutral.
std::string_view tonePrefix(Tone tone);

// Case-insensitive; anything unrecognized maps to Tone::Neutral.
Tone parseTone(std::string_view name);

const char* toneName(Tone tone);

// tonePrefix(tone) + prompt
std::string conditionPrompt(std::string_view prompt, Tone tone);

} // namespace analysis
