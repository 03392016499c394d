#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace utils
{

// Shortens request/response payloads before they reach the log
class Diagnostics
{
public:
    // Verbose mode logs whole response bodies instead of previews
    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static void sanitize(std::string& text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace utils
