#include "FormatOptions.hpp"

#include <charconv>
#include <stdexcept>
#include <utility>

namespace numfmt
{

FormatOptions::FormatOptions(NumberStyle style, std::optional<std::string> currency_code,
                             unsigned min_fraction_digits, unsigned max_fraction_digits, bool use_grouping)
    : style_(style)
    , currency_code_(std::move(currency_code))
    , min_fraction_digits_(min_fraction_digits)
    , max_fraction_digits_(max_fraction_digits)
    , use_grouping_(use_grouping)
{
    if (max_fraction_digits_ < min_fraction_digits_)
    {
        throw std::invalid_argument("maxFractionDigits (" + std::to_string(max_fraction_digits_) +
                                    ") is smaller than minFractionDigits (" + std::to_string(min_fraction_digits_) +
                                    ")");
    }
    if (max_fraction_digits_ > kMaxFractionDigits)
    {
        throw std::invalid_argument("maxFractionDigits (" + std::to_string(max_fraction_digits_) +
                                    ") exceeds the supported maximum of " + std::to_string(kMaxFractionDigits));
    }
}

FormatOptions FormatOptions::decimal(unsigned min_fraction_digits, unsigned max_fraction_digits, bool use_grouping)
{
    return FormatOptions(NumberStyle::Decimal, std::nullopt, min_fraction_digits, max_fraction_digits, use_grouping);
}

FormatOptions FormatOptions::currency(std::string code, unsigned min_fraction_digits, unsigned max_fraction_digits,
                                      bool use_grouping)
{
    std::optional<std::string> currency_code;
    if (!code.empty())
        currency_code = std::move(code);
    return FormatOptions(NumberStyle::Currency, std::move(currency_code), min_fraction_digits, max_fraction_digits,
                         use_grouping);
}

FormatOptions FormatOptions::asDecimal() const
{
    FormatOptions copy = *this;
    copy.style_ = NumberStyle::Decimal;
    copy.currency_code_.reset();
    return copy;
}

FormatOptions FormatOptions::withCurrency(std::string code) const
{
    FormatOptions copy = *this;
    copy.style_ = NumberStyle::Currency;
    if (code.empty())
        copy.currency_code_.reset();
    else
        copy.currency_code_ = std::move(code);
    return copy;
}

l10n::DecimalStyle FormatOptions::decimalStyle() const
{
    return { min_fraction_digits_, max_fraction_digits_, use_grouping_ };
}

namespace
{

std::optional<unsigned> readBound(std::string_view text)
{
    unsigned long bound = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), bound);
    if (text.empty() || ec != std::errc() || end != text.data() + text.size())
        return std::nullopt;
    if (bound > FormatOptions::kMaxFractionDigits)
        return std::nullopt;
    return static_cast<unsigned>(bound);
}

} // namespace

std::optional<std::pair<unsigned, unsigned>> parseFractionDigits(std::string_view text)
{
    const auto colon = text.find(':');
    auto min_digits = readBound(text.substr(0, colon));
    if (!min_digits)
        return std::nullopt;
    if (colon == std::string_view::npos)
        return std::make_pair(*min_digits, *min_digits);

    auto max_digits = readBound(text.substr(colon + 1));
    if (!max_digits)
        return std::nullopt;
    return std::make_pair(*min_digits, *max_digits);
}

} // namespace numfmt
