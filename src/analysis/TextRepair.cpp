#include "TextRepair.hpp"

#include "../processing/TextUtils.hpp"

namespace analysis
{

namespace
{

bool isAsciiSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

constexpr std::string_view kBullet = "\xE2\x80\xA2 ";

} // namespace

std::string stripEchoedPrompt(std::string_view output, std::string_view prompt)
{
    if (!prompt.empty() && output.substr(0, prompt.size()) == prompt)
        output.remove_prefix(prompt.size());
    return std::string(output);
}

std::string collapseWhitespace(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text)
    {
        if (isAsciiSpace(c))
        {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space)
        {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

bool isTerminalPunctuation(char c)
{
    return c == '.' || c == '!' || c == '?';
}

std::string truncateAtLastTerminal(std::string_view text)
{
    if (text.empty() || isTerminalPunctuation(text.back()))
        return std::string(text);

    const auto last = text.find_last_of(".!?");
    if (last == std::string_view::npos)
        return std::string(text);
    return std::string(text.substr(0, last + 1));
}

std::string repairText(std::string_view text)
{
    return truncateAtLastTerminal(collapseWhitespace(text));
}

std::vector<std::string> splitSentences(std::string_view text)
{
    std::vector<std::string> sentences;
    std::size_t start = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (!isTerminalPunctuation(text[i]))
            continue;
        // Keep runs like "?!" or "..." with the sentence they close.
        while (i + 1 < text.size() && isTerminalPunctuation(text[i + 1]))
            ++i;
        auto sentence = processing::trim(text.substr(start, i + 1 - start));
        if (!sentence.empty())
            sentences.push_back(std::move(sentence));
        start = i + 1;
    }
    if (start < text.size())
    {
        auto tail = processing::trim(text.substr(start));
        if (!tail.empty())
            sentences.push_back(std::move(tail));
    }
    return sentences;
}

std::string formatBullets(const std::vector<std::string>& sentences)
{
    std::string out;
    for (const auto& sentence : sentences)
    {
        if (!out.empty())
            out.push_back('\n');
        out.append(kBullet);
        out.append(sentence);
    }
    return out;
}

} // namespace analysis
