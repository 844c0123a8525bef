#pragma once

#include "../l10n/ILocaleProvider.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace numfmt
{

enum class NumberStyle
{
    Decimal,
    Currency
};

/**
 * @brief Validated per-call formatting options.
 *
 * Value type; copies are cheap. The constructor rejects inconsistent bounds
 * with std::invalid_argument so a bad option set never reaches the
 * formatter.
 */
class FormatOptions
{
public:
    static constexpr unsigned kMaxFractionDigits = 20;

    /// Decimal, 2..2 fraction digits, grouping on.
    FormatOptions() = default;

    /// @throws std::invalid_argument if max_fraction_digits < min_fraction_digits
    ///         or max_fraction_digits > kMaxFractionDigits
    FormatOptions(NumberStyle style, std::optional<std::string> currency_code, unsigned min_fraction_digits,
                  unsigned max_fraction_digits, bool use_grouping = true);

    static FormatOptions decimal(unsigned min_fraction_digits = 2, unsigned max_fraction_digits = 2,
                                 bool use_grouping = true);

    /// Currency style. An empty code means "use the active currency" when
    /// going through NumberTextService.
    static FormatOptions currency(std::string code = {}, unsigned min_fraction_digits = 2,
                                  unsigned max_fraction_digits = 2, bool use_grouping = true);

    [[nodiscard]] NumberStyle style() const { return style_; }
    [[nodiscard]] const std::optional<std::string>& currencyCode() const { return currency_code_; }
    [[nodiscard]] unsigned minFractionDigits() const { return min_fraction_digits_; }
    [[nodiscard]] unsigned maxFractionDigits() const { return max_fraction_digits_; }
    [[nodiscard]] bool useGrouping() const { return use_grouping_; }

    [[nodiscard]] bool isCurrency() const { return style_ == NumberStyle::Currency; }

    /// Same digits and grouping, decimal style, no currency code.
    [[nodiscard]] FormatOptions asDecimal() const;

    /// Same digits and grouping, currency style with `code`.
    [[nodiscard]] FormatOptions withCurrency(std::string code) const;

    /// Parameters for the native decimal formatter.
    [[nodiscard]] l10n::DecimalStyle decimalStyle() const;

    bool operator==(const FormatOptions& other) const = default;

private:
    NumberStyle style_ = NumberStyle::Decimal;
    std::optional<std::string> currency_code_;
    unsigned min_fraction_digits_ = 2;
    unsigned max_fraction_digits_ = 2;
    bool use_grouping_ = true;
};

/// Reads "MIN" or "MIN:MAX" fraction digit bounds. nullopt for malformed
/// text or a bound above FormatOptions::kMaxFractionDigits; the order of the
/// bounds is left to the FormatOptions constructor.
[[nodiscard]] std::optional<std::pair<unsigned, unsigned>> parseFractionDigits(std::string_view text);

} // namespace numfmt
