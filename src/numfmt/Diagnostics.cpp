#include "Diagnostics.hpp"

#include <algorithm>

namespace numfmt
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 64 };

namespace
{

struct VisibleEscape
{
    std::string_view bytes;
    std::string_view label;
};

// UTF-8 encodings of separators that render as blanks in a log line
constexpr VisibleEscape kEscapes[] = {
    { "\xC2\xA0", "<NBSP>" },
    { "\xE2\x80\xAF", "<NNBSP>" },
    { "\xE2\x80\x89", "<THINSP>" },
};

} // namespace

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
    const std::size_t limit = MaxPreview();
    std::string out;
    out.reserve(std::min(text.size(), limit) + 16);

    std::size_t pos = 0;
    while (pos < text.size() && pos < limit)
    {
        bool escaped = false;
        for (const auto& escape : kEscapes)
        {
            if (text.substr(pos, escape.bytes.size()) == escape.bytes)
            {
                out += escape.label;
                pos += escape.bytes.size();
                escaped = true;
                break;
            }
        }
        if (escaped)
            continue;

        char ch = text[pos];
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(ch);
            break;
        }
        ++pos;
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
    auto is_control = [](unsigned char c)
    {
        return c < 0x20 && c != '\n' && c != '\t';
    };
    std::replace_if(text.begin(), text.end(), is_control, '?');
}

} // namespace numfmt
