#include "Diagnostics.hpp"

#include <algorithm>

namespace utils
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 200 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    if (bytes == 0)
        bytes = 1;
    max_preview_.store(bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = IsVerbose() ? text.size() : MaxPreview();
    std::string out;
    out.reserve(std::min(text.size(), limit) + 24);

    for (std::size_t i = 0; i < text.size() && i < limit; ++i)
    {
        switch (text[i])
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(text[i]);
            break;
        }
    }

    if (text.size() > limit)
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    sanitize(out);
    return out;
}

void Diagnostics::sanitize(std::string& text)
{
    auto is_control = [](unsigned char c) { return c < 0x20 || c == 0x7F; };
    std::replace_if(text.begin(), text.end(), is_control, '?');
}

} // namespace utils
