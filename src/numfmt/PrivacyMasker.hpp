#pragma once

#include "FormatOptions.hpp"
#include "NumberFormatter.hpp"
#include "../currency/CurrencyDefinition.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace numfmt
{

/**
 * @brief Hides the digits of a formatted value without changing its layout.
 *
 * The numeric run is replaced by one filler glyph per visible character
 * (Unicode code point) of the unmasked numeric run; the sign and the
 * currency symbol stay where the formatter would have put them. The sign
 * is deliberately left visible.
 */
class PrivacyMasker
{
public:
    static constexpr std::string_view kFillerGlyph = "\xE2\x80\xA2"; // U+2022 BULLET

    explicit PrivacyMasker(const NumberFormatter& formatter);

    /// Masks a formatted numeric run (no currency symbol). A leading '-'
    /// or U+2212 is kept as written, a leading '+' is dropped. A null
    /// `currency_def` with `is_currency` set uses the generic sign "¤".
    [[nodiscard]] static std::string mask(std::string_view formatted_numeric, bool is_currency,
                                          const currency::CurrencyDefinition* currency_def);

    /// Formats |value| with `options` as a decimal (same digits and
    /// grouping) and masks it. With `is_currency` the symbol comes from the
    /// option's currency code, resolved through the registry (unknown codes
    /// keep the code itself as symbol).
    [[nodiscard]] std::string maskValue(std::optional<double> value, const std::string& locale,
                                        const FormatOptions& options, bool is_currency) const;

    /// As maskValue, with the currency definition supplied by the caller.
    [[nodiscard]] std::string maskValue(std::optional<double> value, const std::string& locale,
                                        const FormatOptions& options,
                                        const currency::CurrencyDefinition& currency_def) const;

    /// `count` filler glyphs, at least one.
    [[nodiscard]] static std::string filler(std::size_t count);

private:
    [[nodiscard]] static std::string assemble(std::string_view sign, std::size_t hidden_chars, bool is_currency,
                                              const currency::CurrencyDefinition* currency_def);

    [[nodiscard]] std::string maskResolved(std::optional<double> value, const std::string& locale,
                                           const FormatOptions& options, bool is_currency,
                                           const currency::CurrencyDefinition* currency_def) const;

    const NumberFormatter& formatter_;
};

} // namespace numfmt
