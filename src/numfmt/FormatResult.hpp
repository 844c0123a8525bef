#pragma once

#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace numfmt
{

// Recovered problems. None of them is ever thrown; results carry the tag.
enum class FormatError
{
    InvalidLocale,      // Locale tag unsupported or malformed
    UnresolvedCurrency, // Currency code absent from the registry
    UnparsableInput     // Text does not reduce to a numeric literal
};

// Fallback tier that produced a formatted string, best first.
enum class FormatTier
{
    Native,        // Requested locale
    DefaultLocale, // Runtime default locale
    FixedPoint,    // Plain fixed-point text, no locale
    NoValue        // Absent or non-finite input, empty text
};

[[nodiscard]] const char* toString(FormatError error);
[[nodiscard]] const char* toString(FormatTier tier);

struct FormatResult
{
    std::string text;
    FormatTier tier = FormatTier::NoValue;
    std::optional<FormatError> error; // First problem hit while producing text
    bool currency_applied = false;    // Symbol placed from a registry definition

    [[nodiscard]] bool degraded() const { return tier == FormatTier::DefaultLocale || tier == FormatTier::FixedPoint; }

    static FormatResult noValue()
    {
        return {};
    }

    static FormatResult make(std::string text, FormatTier tier, std::optional<FormatError> error)
    {
        FormatResult res;
        res.text = std::move(text);
        res.tier = tier;
        res.error = error;
        return res;
    }
};

struct ParseResult
{
    double value = std::numeric_limits<double>::quiet_NaN();
    std::optional<FormatError> error;
    bool separators_from_locale = false; // false: probe failed, commas dropped

    [[nodiscard]] bool ok() const { return !error.has_value(); }
};

} // namespace numfmt
