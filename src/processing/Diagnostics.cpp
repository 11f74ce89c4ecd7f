#include "Diagnostics.hpp"
#include "TextUtils.hpp"

namespace processing
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::preview_codepoints_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept { verbose_ = enabled; }

bool Diagnostics::IsVerbose() noexcept { return verbose_; }

void Diagnostics::SetMaxPreview(std::size_t codepoints) noexcept
{
    preview_codepoints_ = codepoints > 0 ? codepoints : 1;
}

std::size_t Diagnostics::MaxPreview() noexcept { return preview_codepoints_; }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t total = codepointCount(text);
    const std::string head = truncateCodepoints(std::string(text), MaxPreview());

    std::string out;
    out.reserve(head.size() + 16);
    for (const char ch : head)
    {
        const auto byte = static_cast<unsigned char>(ch);
        if (ch == '\n')
            out += "\\n";
        else if (ch == '\r')
            out += "\\r";
        else if (ch == '\t')
            out += "\\t";
        else if (byte < 0x20 || byte == 0x7F)
            out += '?';
        else
            out += ch;
    }

    if (total > MaxPreview())
        out += " [+" + std::to_string(total - MaxPreview()) + " chars]";
    return out;
}

} // namespace processing
