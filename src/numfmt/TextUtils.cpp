#include "TextUtils.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <utf8proc.h>

namespace numfmt
{

namespace
{

// Decodes one code point at `pos`, returning bytes consumed (at least 1).
// Malformed sequences yield -1 as the code point.
std::size_t decodeAt(std::string_view utf8, std::size_t pos, std::int32_t& cp)
{
    utf8proc_int32_t out = -1;
    utf8proc_ssize_t consumed = utf8proc_iterate(reinterpret_cast<const utf8proc_uint8_t*>(utf8.data() + pos),
                                                 static_cast<utf8proc_ssize_t>(utf8.size() - pos), &out);
    if (consumed <= 0)
    {
        cp = -1;
        return 1;
    }
    cp = out;
    return static_cast<std::size_t>(consumed);
}

} // namespace

std::size_t countCodepoints(std::string_view utf8)
{
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < utf8.size())
    {
        std::int32_t cp = 0;
        pos += decodeAt(utf8, pos, cp);
        ++count;
    }
    return count;
}

std::vector<std::string> splitCodepoints(std::string_view utf8)
{
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos < utf8.size())
    {
        std::int32_t cp = 0;
        std::size_t len = decodeAt(utf8, pos, cp);
        out.emplace_back(utf8.substr(pos, len));
        pos += len;
    }
    return out;
}

bool isSeparatorSpace(std::int32_t cp)
{
    if (cp < 0)
        return false;
    if (cp == ' ' || (cp >= 0x09 && cp <= 0x0D))
        return true;
    if (cp == 0xFEFF)
        return true;

    switch (utf8proc_category(cp))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

std::string stripSeparatorSpaces(std::string_view utf8)
{
    std::string out;
    out.reserve(utf8.size());

    std::size_t pos = 0;
    while (pos < utf8.size())
    {
        std::int32_t cp = 0;
        std::size_t len = decodeAt(utf8, pos, cp);
        if (!isSeparatorSpace(cp))
        {
            out.append(utf8.substr(pos, len));
        }
        pos += len;
    }
    return out;
}

std::string trimSpaces(std::string_view utf8)
{
    std::size_t begin = 0;
    std::size_t end = 0;
    bool seen_content = false;

    std::size_t pos = 0;
    while (pos < utf8.size())
    {
        std::int32_t cp = 0;
        std::size_t len = decodeAt(utf8, pos, cp);
        if (!isSeparatorSpace(cp))
        {
            if (!seen_content)
            {
                begin = pos;
                seen_content = true;
            }
            end = pos + len;
        }
        pos += len;
    }

    if (!seen_content)
        return {};
    return std::string(utf8.substr(begin, end - begin));
}

std::string replaceAll(std::string_view text, std::string_view from, std::string_view to)
{
    if (from.empty())
        return std::string(text);

    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (true)
    {
        std::size_t hit = text.find(from, pos);
        if (hit == std::string_view::npos)
        {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, hit - pos));
        out.append(to);
        pos = hit + from.size();
    }
    return out;
}

std::string keepNumericChars(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        if ((c >= '0' && c <= '9') || c == '.' || c == '+' || c == '-')
            out.push_back(c);
    }
    return out;
}

std::optional<double> parseLeadingDecimal(std::string_view text)
{
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
    {
        negative = text[pos] == '-';
        ++pos;
    }

    auto is_digit = [](char c) { return c >= '0' && c <= '9'; };

    std::size_t int_begin = pos;
    while (pos < text.size() && is_digit(text[pos]))
        ++pos;
    std::string_view int_part = text.substr(int_begin, pos - int_begin);

    std::string_view frac_part;
    if (pos < text.size() && text[pos] == '.')
    {
        std::size_t frac_begin = ++pos;
        while (pos < text.size() && is_digit(text[pos]))
            ++pos;
        frac_part = text.substr(frac_begin, pos - frac_begin);
    }

    if (int_part.empty() && frac_part.empty())
        return std::nullopt;

    // from_chars rejects a leading '+' and a bare ".5", so feed it a
    // normalised literal
    std::string literal;
    literal.reserve(int_part.size() + frac_part.size() + 3);
    if (negative)
        literal.push_back('-');
    literal.append(int_part.empty() ? std::string_view("0") : int_part);
    if (!frac_part.empty())
    {
        literal.push_back('.');
        literal.append(frac_part);
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), value);
    if (ec == std::errc::result_out_of_range)
    {
        bool huge = int_part.find_first_not_of('0') != std::string_view::npos;
        double magnitude = huge ? std::numeric_limits<double>::infinity() : 0.0;
        return negative ? -magnitude : magnitude;
    }
    if (ec != std::errc())
        return std::nullopt;
    return value;
}

std::string canonicalNumberText(double value)
{
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value > 0 ? "Infinity" : "-Infinity";
    if (value == 0.0)
        return "0";

    std::array<char, 512> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::fixed);
    if (ec != std::errc())
        return fixedPointText(value, 6);
    return std::string(buffer.data(), ptr);
}

std::string fixedPointText(double value, unsigned decimals)
{
    if (!std::isfinite(value))
        return canonicalNumberText(value);

    std::array<char, 512> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::fixed,
                                   static_cast<int>(decimals));
    if (ec != std::errc())
        return {};
    return std::string(buffer.data(), ptr);
}

} // namespace numfmt
