#include "NumberFormatter.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <cmath>
#include <plog/Log.h>

namespace numfmt
{

NumberFormatter::NumberFormatter(const l10n::ILocaleProvider& provider, const currency::CurrencyRegistry& registry)
    : provider_(provider)
    , registry_(registry)
{
}

std::string NumberFormatter::format(std::optional<double> value, const std::string& locale,
                                    const FormatOptions& options) const
{
    return formatDetailed(value, locale, options).text;
}

FormatResult NumberFormatter::formatDetailed(std::optional<double> value, const std::string& locale,
                                             const FormatOptions& options) const
{
    if (!value.has_value() || !std::isfinite(*value))
        return FormatResult::noValue();

    const double number = *value;
    std::optional<FormatError> currency_error;

    if (options.isCurrency())
    {
        const currency::CurrencyDefinition* def = nullptr;
        if (options.currencyCode())
            def = registry_.find(*options.currencyCode());

        if (def != nullptr)
        {
            FormatResult result = formatDecimal(std::fabs(number), locale, options.decimalStyle());
            const std::string sign = number < 0 ? "-" : "";
            if (def->position == currency::SymbolPosition::Leading)
                result.text = sign + def->symbol + result.text;
            else
                result.text = sign + result.text + " " + def->symbol;
            result.currency_applied = true;
            return result;
        }

        currency_error = FormatError::UnresolvedCurrency;
        if (Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "NumberFormatter: currency '"
                                                   << options.currencyCode().value_or("") << "' not registered, "
                                                   << "formatting as decimal";
        }
    }

    FormatResult result = formatDecimal(number, locale, options.decimalStyle());
    if (currency_error)
        result.error = currency_error;
    return result;
}

FormatResult NumberFormatter::formatDecimal(double value, const std::string& locale,
                                            const l10n::DecimalStyle& style) const
{
    if (auto text = provider_.formatDecimal(value, locale, style))
        return FormatResult::make(std::move(*text), FormatTier::Native, std::nullopt);

    const std::string fallback_locale = provider_.defaultLocale();
    if (Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "NumberFormatter: locale '" << Diagnostics::Preview(locale)
                                               << "' unavailable, retrying with '" << fallback_locale << "'";
    }

    if (fallback_locale != locale)
    {
        if (auto text = provider_.formatDecimal(value, fallback_locale, style))
            return FormatResult::make(std::move(*text), FormatTier::DefaultLocale, FormatError::InvalidLocale);
    }

    PLOG_WARNING << "NumberFormatter: no locale data for '" << Diagnostics::Preview(locale) << "' or '"
                 << fallback_locale << "', using fixed-point text";
    return FormatResult::make(fixedPointText(value, style.max_fraction_digits), FormatTier::FixedPoint,
                              FormatError::InvalidLocale);
}

} // namespace numfmt
