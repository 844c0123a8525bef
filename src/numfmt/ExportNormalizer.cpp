#include "ExportNormalizer.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <plog/Log.h>

namespace numfmt
{

const char* toString(MixedSeparatorPolicy policy)
{
    switch (policy)
    {
    case MixedSeparatorPolicy::LastIsDecimal:
        return "last_is_decimal";
    case MixedSeparatorPolicy::CommaIsGrouping:
        return "comma_is_grouping";
    }
    return "last_is_decimal";
}

std::optional<MixedSeparatorPolicy> parseMixedSeparatorPolicy(std::string_view text)
{
    if (text == "last_is_decimal")
        return MixedSeparatorPolicy::LastIsDecimal;
    if (text == "comma_is_grouping")
        return MixedSeparatorPolicy::CommaIsGrouping;
    return std::nullopt;
}

ExportNormalizer::ExportNormalizer(MixedSeparatorPolicy policy)
    : policy_(policy)
{
}

std::string ExportNormalizer::normalize(double value) const { return canonicalNumberText(value); }

std::string ExportNormalizer::normalize(std::string_view text) const
{
    std::string trimmed = trimSpaces(text);
    if (trimmed.empty())
        return {};

    std::string normalized = stripSeparatorSpaces(trimmed);

    const std::size_t last_comma = normalized.rfind(',');
    const std::size_t last_period = normalized.rfind('.');
    const bool has_comma = last_comma != std::string::npos;
    const bool has_period = last_period != std::string::npos;

    if (has_comma && !has_period)
    {
        // "1234,56": comma is the decimal separator
        normalized = replaceAll(normalized, ",", ".");
    }
    else if (has_comma && has_period)
    {
        if (policy_ == MixedSeparatorPolicy::LastIsDecimal && last_comma > last_period)
        {
            // "1.234,56": periods group, the trailing comma is the decimal point
            normalized = replaceAll(normalized, ".", "");
            normalized = replaceAll(normalized, ",", ".");
        }
        else
        {
            normalized = replaceAll(normalized, ",", "");
        }
    }

    auto value = parseLeadingDecimal(keepNumericChars(normalized));
    if (!value)
    {
        if (Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "ExportNormalizer: keeping non-numeric '"
                                                   << Diagnostics::Preview(trimmed) << "'";
        }
        return trimmed;
    }
    return canonicalNumberText(*value);
}

} // namespace numfmt
