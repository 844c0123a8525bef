#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace numfmt
{

/// Number of Unicode code points in a UTF-8 string.
/// Invalid bytes count as one code point each.
[[nodiscard]] std::size_t countCodepoints(std::string_view utf8);

/// One string per code point; malformed bytes come out one at a time.
[[nodiscard]] std::vector<std::string> splitCodepoints(std::string_view utf8);

/// ASCII whitespace, Unicode space/line/paragraph separators (NBSP and
/// narrow NBSP included) and the BOM.
[[nodiscard]] bool isSeparatorSpace(std::int32_t cp);

/// Removes every code point matched by isSeparatorSpace.
[[nodiscard]] std::string stripSeparatorSpaces(std::string_view utf8);

/// Trims isSeparatorSpace code points from both ends.
[[nodiscard]] std::string trimSpaces(std::string_view utf8);

/// Replaces every non-overlapping occurrence of `from` with `to`.
[[nodiscard]] std::string replaceAll(std::string_view text, std::string_view from, std::string_view to);

/// Keeps only ASCII digits, '.', '+' and '-'.
[[nodiscard]] std::string keepNumericChars(std::string_view text);

/// Parses the longest leading decimal literal (optional sign, digits,
/// optional fraction). Trailing characters are ignored; nullopt when no
/// digit can be consumed.
[[nodiscard]] std::optional<double> parseLeadingDecimal(std::string_view text);

/// Shortest round-trip decimal text in fixed notation ("1234.56", "0", "-5").
[[nodiscard]] std::string canonicalNumberText(double value);

/// Fixed-point text with exactly `decimals` fraction digits, '.' as the
/// decimal point and no grouping.
[[nodiscard]] std::string fixedPointText(double value, unsigned decimals);

} // namespace numfmt
