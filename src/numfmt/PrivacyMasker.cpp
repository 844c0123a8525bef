#include "PrivacyMasker.hpp"
#include "TextUtils.hpp"
#include "../currency/CurrencyRegistry.hpp"

#include <algorithm>
#include <cmath>

namespace numfmt
{

namespace
{

constexpr std::string_view kUnicodeMinus = "\xE2\x88\x92";

// Text in front of `body` in `signed_text` ("\xE2\x88\x92" for sv-SE, bidi
// marks included for fa-IR). Plain '-' when the renderings do not line up.
std::string signPrefix(std::string_view signed_text, std::string_view body)
{
    if (signed_text.size() > body.size() &&
        signed_text.compare(signed_text.size() - body.size(), body.size(), body) == 0)
    {
        return std::string(signed_text.substr(0, signed_text.size() - body.size()));
    }
    return "-";
}

} // namespace

PrivacyMasker::PrivacyMasker(const NumberFormatter& formatter)
    : formatter_(formatter)
{
}

std::string PrivacyMasker::filler(std::size_t count)
{
    count = std::max<std::size_t>(count, 1);
    std::string out;
    out.reserve(count * kFillerGlyph.size());
    for (std::size_t i = 0; i < count; ++i)
        out.append(kFillerGlyph);
    return out;
}

std::string PrivacyMasker::assemble(std::string_view sign, std::size_t hidden_chars, bool is_currency,
                                    const currency::CurrencyDefinition* currency_def)
{
    const std::string masked = filler(hidden_chars);

    if (!is_currency)
        return std::string(sign) + masked;

    if (currency_def == nullptr)
        return std::string(sign) + std::string(currency::kGenericCurrencySign) + masked;

    const std::string& symbol = currency_def->symbol.empty() ? currency_def->code : currency_def->symbol;
    if (currency_def->position == currency::SymbolPosition::Leading)
        return std::string(sign) + symbol + masked;
    return std::string(sign) + masked + " " + symbol;
}

std::string PrivacyMasker::mask(std::string_view formatted_numeric, bool is_currency,
                                const currency::CurrencyDefinition* currency_def)
{
    std::string_view sign;
    if (!formatted_numeric.empty() && formatted_numeric.front() == '-')
    {
        sign = formatted_numeric.substr(0, 1);
        formatted_numeric.remove_prefix(1);
    }
    else if (formatted_numeric.substr(0, kUnicodeMinus.size()) == kUnicodeMinus)
    {
        sign = kUnicodeMinus;
        formatted_numeric.remove_prefix(kUnicodeMinus.size());
    }
    else if (!formatted_numeric.empty() && formatted_numeric.front() == '+')
    {
        formatted_numeric.remove_prefix(1);
    }

    return assemble(sign, countCodepoints(formatted_numeric), is_currency, currency_def);
}

std::string PrivacyMasker::maskValue(std::optional<double> value, const std::string& locale,
                                     const FormatOptions& options, bool is_currency) const
{
    if (!is_currency)
        return maskResolved(value, locale, options, false, nullptr);

    const currency::CurrencyDefinition def = formatter_.registry().resolve(options.currencyCode().value_or(""));
    return maskResolved(value, locale, options, true, &def);
}

std::string PrivacyMasker::maskValue(std::optional<double> value, const std::string& locale,
                                     const FormatOptions& options,
                                     const currency::CurrencyDefinition& currency_def) const
{
    return maskResolved(value, locale, options, true, &currency_def);
}

std::string PrivacyMasker::maskResolved(std::optional<double> value, const std::string& locale,
                                        const FormatOptions& options, bool is_currency,
                                        const currency::CurrencyDefinition* currency_def) const
{
    // Same decimal rendering the formatter uses for the body of a currency
    // string, so the glyph count follows grouping and fraction digits.
    // Currency strings are composed with '-'; decimals carry the locale's own
    // minus sign.
    std::string numeric;
    std::string sign;
    if (value.has_value() && std::isfinite(*value))
    {
        numeric = formatter_.formatDecimal(std::fabs(*value), locale, options.decimalStyle()).text;
        if (*value < 0)
        {
            sign = is_currency ? "-"
                               : signPrefix(formatter_.formatDecimal(*value, locale, options.decimalStyle()).text,
                                            numeric);
        }
    }

    return assemble(sign, countCodepoints(numeric), is_currency, currency_def);
}

} // namespace numfmt
