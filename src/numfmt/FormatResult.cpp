#include "FormatResult.hpp"

namespace numfmt
{

const char* toString(FormatError error)
{
    switch (error)
    {
    case FormatError::InvalidLocale:
        return "InvalidLocale";
    case FormatError::UnresolvedCurrency:
        return "UnresolvedCurrency";
    case FormatError::UnparsableInput:
        return "UnparsableInput";
    }
    return "Unknown";
}

const char* toString(FormatTier tier)
{
    switch (tier)
    {
    case FormatTier::Native:
        return "Native";
    case FormatTier::DefaultLocale:
        return "DefaultLocale";
    case FormatTier::FixedPoint:
        return "FixedPoint";
    case FormatTier::NoValue:
        return "NoValue";
    }
    return "Unknown";
}

} // namespace numfmt
