#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace numfmt
{

/// How to read text holding both ',' and '.'.
enum class MixedSeparatorPolicy
{
    LastIsDecimal,  // Whichever separator occurs last is the decimal point
    CommaIsGrouping // Commas are always grouping ("1.234,56" reads as 1.23456)
};

[[nodiscard]] const char* toString(MixedSeparatorPolicy policy);
[[nodiscard]] std::optional<MixedSeparatorPolicy> parseMixedSeparatorPolicy(std::string_view text);

/**
 * @brief Locale-agnostic recovery of numeric text of unknown origin.
 *
 * Used for re-serialisation (export files, pasted or imported values).
 * Text that does not reduce to a number is returned trimmed but otherwise
 * untouched, so an export never silently replaces data with a sentinel.
 * normalize(normalize(s)) == normalize(s) for every s.
 */
class ExportNormalizer
{
public:
    explicit ExportNormalizer(MixedSeparatorPolicy policy = MixedSeparatorPolicy::LastIsDecimal);

    [[nodiscard]] std::string normalize(std::string_view text) const;
    [[nodiscard]] std::string normalize(double value) const;

    [[nodiscard]] MixedSeparatorPolicy policy() const { return policy_; }

private:
    MixedSeparatorPolicy policy_;
};

} // namespace numfmt
