#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

/// Number of Unicode code points (invalid bytes count as one each)
std::size_t codepointCount(std::string_view text);

/// First max_codepoints code points of text, never splitting a sequence
std::string truncateCodepoints(const std::string& text, std::size_t max_codepoints);

/// Strip leading and trailing ASCII whitespace
std::string trim(std::string_view text);

/// Split on runs of ASCII whitespace, dropping empty tokens
std::vector<std::string> splitWhitespace(std::string_view text);

/// Count of whitespace-delimited tokens
std::size_t countWords(std::string_view text);

} // namespace processing
