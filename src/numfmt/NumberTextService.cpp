#include "NumberTextService.hpp"

namespace numfmt
{

namespace
{

constexpr const char* kFallbackCurrency = "USD";

} // namespace

NumberTextService::NumberTextService(const l10n::ILocaleProvider& provider, const currency::CurrencyRegistry& registry,
                                     MixedSeparatorPolicy export_policy)
    : formatter_(provider, registry)
    , parser_(provider)
    , normalizer_(export_policy)
    , masker_(formatter_)
{
}

std::string NumberTextService::format(std::optional<double> value, const std::string& locale,
                                      const FormatOptions& options) const
{
    return formatter_.format(value, locale, options);
}

FormatResult NumberTextService::formatDetailed(std::optional<double> value, const std::string& locale,
                                               const FormatOptions& options) const
{
    return formatter_.formatDetailed(value, locale, options);
}

double NumberTextService::parse(std::string_view text, const std::string& locale) const
{
    return parser_.parse(text, locale);
}

std::string NumberTextService::normalizeForExport(std::string_view text) const { return normalizer_.normalize(text); }

std::string NumberTextService::normalizeForExport(double value) const { return normalizer_.normalize(value); }

std::string NumberTextService::mask(std::optional<double> value, const std::string& locale,
                                    const FormatOptions& options, bool is_currency) const
{
    return masker_.maskValue(value, locale, options, is_currency);
}

std::string NumberTextService::formatForDisplay(std::optional<double> value,
                                                const config::NumberFormatSettings& settings,
                                                const FormatOptions& options, DisplayFlags flags) const
{
    FormatOptions effective = options;
    if (effective.isCurrency() && !effective.currencyCode())
    {
        effective = effective.withCurrency(settings.currency.empty() ? kFallbackCurrency : settings.currency);
    }

    if (!settings.privacy_mode || flags.ignore_privacy)
        return formatter_.format(value, settings.locale, effective);

    if (!effective.isCurrency())
        return masker_.maskValue(value, settings.locale, effective, false);

    // Symbol for the masked amount: requested code, then the active
    // currency, then the code itself
    const auto& registry = formatter_.registry();
    const std::string& code = *effective.currencyCode();
    const currency::CurrencyDefinition* def = registry.find(code);
    if (def == nullptr)
        def = registry.find(settings.currency);

    const currency::CurrencyDefinition resolved = def != nullptr ? *def : registry.resolve(code);
    return masker_.maskValue(value, settings.locale, effective, resolved);
}

double NumberTextService::parseForDisplay(std::string_view text, const config::NumberFormatSettings& settings) const
{
    return parser_.parse(text, settings.locale);
}

} // namespace numfmt
