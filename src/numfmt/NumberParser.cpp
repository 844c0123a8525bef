#include "NumberParser.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <plog/Log.h>

namespace numfmt
{

namespace
{

// U+2212 MINUS SIGN, used instead of '-' by some locales
constexpr std::string_view kUnicodeMinus = "\xE2\x88\x92";

} // namespace

NumberParser::NumberParser(const l10n::ILocaleProvider& provider)
    : provider_(provider)
{
}

double NumberParser::parse(std::string_view text, const std::string& locale) const
{
    return parseDetailed(text, locale).value;
}

double NumberParser::parse(double value, const std::string&) const { return value; }

std::optional<Separators> NumberParser::probeSeparators(const std::string& locale) const
{
    auto parts = provider_.formatToParts(kProbeValue, locale, l10n::DecimalStyle{ 0, 3, true });
    if (!parts)
        return std::nullopt;

    Separators separators;
    bool group_seen = false;
    bool decimal_seen = false;
    for (const auto& part : *parts)
    {
        if (part.type == l10n::PartType::Group && !group_seen)
        {
            separators.group = part.value;
            group_seen = true;
        }
        else if (part.type == l10n::PartType::Decimal && !decimal_seen)
        {
            separators.decimal = part.value;
            decimal_seen = true;
        }
    }

    // Ungrouped "1234567890" lists every digit glyph once
    if (auto digit_parts = provider_.formatToParts(kDigitProbeValue, locale, l10n::DecimalStyle{ 0, 0, false }))
    {
        std::string integer;
        for (const auto& part : *digit_parts)
        {
            if (part.type == l10n::PartType::Integer)
                integer += part.value;
        }
        auto glyphs = splitCodepoints(integer);
        if (glyphs.size() == separators.digits.size() && glyphs.front() != "1")
        {
            for (std::size_t i = 0; i < glyphs.size(); ++i)
                separators.digits[(i + 1) % 10] = glyphs[i];
        }
    }
    return separators;
}

ParseResult NumberParser::parseDetailed(std::string_view text, const std::string& locale) const
{
    ParseResult result;

    std::string trimmed = trimSpaces(text);
    if (trimmed.empty())
    {
        result.error = FormatError::UnparsableInput;
        return result;
    }

    std::string normalized = stripSeparatorSpaces(trimmed);
    normalized = replaceAll(normalized, kUnicodeMinus, "-");

    if (auto separators = probeSeparators(locale))
    {
        for (std::size_t d = 0; d < separators->digits.size(); ++d)
        {
            if (!separators->digits[d].empty())
                normalized = replaceAll(normalized, separators->digits[d], std::string(1, static_cast<char>('0' + d)));
        }
        normalized = replaceAll(normalized, separators->group, "");
        if (separators->decimal != ".")
            normalized = replaceAll(normalized, separators->decimal, ".");
        result.separators_from_locale = true;
    }
    else
    {
        normalized = replaceAll(normalized, ",", "");
        if (Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "NumberParser: no separators for '" << Diagnostics::Preview(locale)
                                                   << "', dropping commas";
        }
    }

    std::string cleaned = keepNumericChars(normalized);
    auto value = parseLeadingDecimal(cleaned);
    if (!value)
    {
        result.error = FormatError::UnparsableInput;
        if (Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "NumberParser: '" << Diagnostics::Preview(text)
                                                   << "' is not a number";
        }
        return result;
    }

    result.value = *value;
    return result;
}

} // namespace numfmt
