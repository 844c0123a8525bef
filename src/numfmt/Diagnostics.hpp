#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace numfmt
{

// Per-call tracing switch for the formatter, parser and normalizer.
// Traces go to the plog instance kLogInstance so hosts can route them to
// their own file.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Clips user text for logging. Invisible separators (NBSP, narrow NBSP,
    // thin space) are spelled out so grouping problems show up in the log.
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static void sanitize(std::string& text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace numfmt
