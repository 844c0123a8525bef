#pragma once

#include <optional>
#include <string>
#include <vector>

namespace l10n
{

/// Decimal rendering parameters handed to the native formatter.
struct DecimalStyle
{
    unsigned min_fraction_digits = 2;
    unsigned max_fraction_digits = 2;
    bool use_grouping = true;
};

/// Structural role of a run of characters in a formatted number.
enum class PartType
{
    Integer,
    Group,
    Decimal,
    Fraction,
    MinusSign,
    PlusSign,
    Literal
};

struct NumberPart
{
    PartType type;
    std::string value; // UTF-8
};

/**
 * @brief Narrow view over a native locale database.
 *
 * The formatter and parser only ever talk to locale data through this
 * interface, so tests can plug in synthetic locales and hosts can swap the
 * backing library. Implementations must be stateless or internally
 * synchronised: every method is called concurrently.
 */
class ILocaleProvider
{
public:
    virtual ~ILocaleProvider() = default;

    /// Whether `tag` names a locale the provider has data for.
    [[nodiscard]] virtual bool isSupported(const std::string& tag) const = 0;

    /// Tag of the runtime default locale. Must be supported.
    [[nodiscard]] virtual std::string defaultLocale() const = 0;

    /// Native decimal rendering of `value`; nullopt when the locale is
    /// unsupported or the native formatter fails.
    [[nodiscard]] virtual std::optional<std::string> formatDecimal(double value, const std::string& tag,
                                                                   const DecimalStyle& style) const = 0;

    /// Same rendering split into typed parts, in order. Concatenating the
    /// part values yields formatDecimal's text.
    [[nodiscard]] virtual std::optional<std::vector<NumberPart>> formatToParts(double value, const std::string& tag,
                                                                               const DecimalStyle& style) const = 0;
};

} // namespace l10n
