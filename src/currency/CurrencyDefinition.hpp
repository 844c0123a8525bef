#pragma once

#include <string>

namespace currency
{

/// Where the symbol goes relative to the number: "$10.00" vs "10,00 €".
enum class SymbolPosition
{
    Leading,
    Trailing
};

/// One entry of the currency dataset. Immutable once registered.
struct CurrencyDefinition
{
    std::string code;         // ISO 4217-like key, e.g. "EUR"
    std::string symbol;       // e.g. "€"
    std::string display_name; // e.g. "Euro"
    SymbolPosition position = SymbolPosition::Leading;

    bool operator==(const CurrencyDefinition& other) const = default;
};

} // namespace currency
