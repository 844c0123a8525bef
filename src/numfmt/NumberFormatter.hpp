#pragma once

#include "FormatOptions.hpp"
#include "FormatResult.hpp"
#include "../currency/CurrencyRegistry.hpp"
#include "../l10n/ILocaleProvider.hpp"

#include <optional>
#include <string>

namespace numfmt
{

/**
 * @brief Renders canonical values as locale- and currency-specific text.
 *
 * Currency symbols are placed from CurrencyDefinition::position only; the
 * locale's own currency pattern is never consulted. Locale failures walk
 * an ordered fallback chain (requested locale, runtime default locale,
 * fixed-point text) and the tier that succeeded is reported in the result.
 *
 * Holds references to the provider and registry; both must outlive it.
 * Stateless otherwise, so one instance can serve every thread.
 */
class NumberFormatter
{
public:
    NumberFormatter(const l10n::ILocaleProvider& provider, const currency::CurrencyRegistry& registry);

    /// Display text, or "" for an absent or non-finite value. Never throws.
    [[nodiscard]] std::string format(std::optional<double> value, const std::string& locale,
                                     const FormatOptions& options) const;

    /// Same as format() with the fallback tier and recovered error exposed.
    [[nodiscard]] FormatResult formatDetailed(std::optional<double> value, const std::string& locale,
                                              const FormatOptions& options) const;

    /// Locale decimal rendering of `value` through the fallback chain.
    [[nodiscard]] FormatResult formatDecimal(double value, const std::string& locale,
                                             const l10n::DecimalStyle& style) const;

    [[nodiscard]] const l10n::ILocaleProvider& provider() const { return provider_; }
    [[nodiscard]] const currency::CurrencyRegistry& registry() const { return registry_; }

private:
    const l10n::ILocaleProvider& provider_;
    const currency::CurrencyRegistry& registry_;
};

} // namespace numfmt
