#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace analysis
{

// Cleanup applied to raw decoder output before it is returned to a client.
// All functions are pure and independent of any oracle.

// Removes `prompt` when `output` starts with it verbatim; otherwise returns output unchanged.
std::string stripEchoedPrompt(std::string_view output, std::string_view prompt);

// Replaces every run of ASCII whitespace with one space and trims both ends.
std::string collapseWhitespace(std::string_view text);

bool isTerminalPunctuation(char c);

// If text does not end in '.', '!' or '?', cuts it after the last such character.
// Text without any terminal punctuation is returned as-is.
std::string truncateAtLastTerminal(std::string_view text);

// collapseWhitespace followed by truncateAtLastTerminal.
std::string repairText(std::string_view text);

// Splits prose on '.', '!' and '?' keeping the terminator; trimmed, empty pieces dropped.
std::vector<std::string> splitSentences(std::string_view text);

// One "• sentence" line per sentence.
std::string formatBullets(const std::vector<std::string>& sentences);

} // namespace analysis
