#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

// Runtime switches for the pipeline trace log. Stage outcomes go to plog
// instance kLogInstance; request text is only ever logged through Preview().
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    static bool IsVerbose() noexcept;

    // Preview length in code points, at least 1.
    static void SetMaxPreview(std::size_t codepoints) noexcept;
    static std::size_t MaxPreview() noexcept;

    // Single-line excerpt: newlines and tabs become visible escapes, other
    // control bytes become '?', long text gets a "[+N chars]" suffix.
    static std::string Preview(std::string_view text);

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> preview_codepoints_;
};

} // namespace processing
