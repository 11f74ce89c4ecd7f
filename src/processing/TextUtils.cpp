#include "TextUtils.hpp"
#include <utf8proc.h>

#include <cctype>

namespace processing
{

namespace
{

bool isSpace(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::size_t codepointCount(std::string_view text)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    std::size_t count = 0;
    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        pos += bytes > 0 ? bytes : 1;
        ++count;
    }
    return count;
}

std::string truncateCodepoints(const std::string& text, std::size_t max_codepoints)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    std::size_t count = 0;
    utf8proc_ssize_t pos = 0;
    while (pos < len && count < max_codepoints)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        pos += bytes > 0 ? bytes : 1;
        ++count;
    }
    return text.substr(0, static_cast<std::size_t>(pos));
}

std::string trim(std::string_view text)
{
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && isSpace(text[begin]))
        ++begin;
    while (end > begin && isSpace(text[end - 1]))
        --end;
    return std::string(text.substr(begin, end - begin));
}

std::vector<std::string> splitWhitespace(std::string_view text)
{
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < text.size())
    {
        while (i < text.size() && isSpace(text[i]))
            ++i;
        std::size_t start = i;
        while (i < text.size() && !isSpace(text[i]))
            ++i;
        if (i > start)
            tokens.emplace_back(text.substr(start, i - start));
    }
    return tokens;
}

std::size_t countWords(std::string_view text)
{
    std::size_t count = 0;
    bool in_word = false;
    for (char c : text)
    {
        if (isSpace(c))
        {
            in_word = false;
        }
        else if (!in_word)
        {
            in_word = true;
            ++count;
        }
    }
    return count;
}

} // namespace processing
