#pragma once

#include "FormatResult.hpp"
#include "../l10n/ILocaleProvider.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace numfmt
{

/// Group and decimal separators of a locale, read off a probe rendering,
/// and its digit glyphs when it does not write ASCII digits.
struct Separators
{
    std::string group = ",";
    std::string decimal = ".";
    std::array<std::string, 10> digits; // digits[d] renders d; all empty for ASCII
};

/**
 * @brief Recovers canonical values from display text of a known locale.
 *
 * Separators are not tabulated: they are read from the provider's
 * structural parts for a fixed probe value, so any locale the provider
 * knows is handled. Native digits (Arabic-Indic, Devanagari, ...) are read
 * the same way and folded to ASCII. Unparsable text yields a quiet NaN, never an exception.
 */
class NumberParser
{
public:
    static constexpr double kProbeValue = 12345.6;
    static constexpr double kDigitProbeValue = 1234567890.0;

    explicit NumberParser(const l10n::ILocaleProvider& provider);

    /// Canonical value of `text`, quiet NaN on failure.
    [[nodiscard]] double parse(std::string_view text, const std::string& locale) const;

    /// Numbers pass through unchanged.
    [[nodiscard]] double parse(double value, const std::string& locale) const;

    [[nodiscard]] ParseResult parseDetailed(std::string_view text, const std::string& locale) const;

    /// Separators for `locale`; nullopt when the provider has no data.
    [[nodiscard]] std::optional<Separators> probeSeparators(const std::string& locale) const;

private:
    const l10n::ILocaleProvider& provider_;
};

} // namespace numfmt
