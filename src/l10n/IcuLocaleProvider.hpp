#pragma once

#include "ILocaleProvider.hpp"

#include <string>

namespace l10n
{

/// ILocaleProvider backed by ICU's number formatting (CLDR data).
/// Rounding is half away from zero to match the display strings the rest of
/// the host produces.
class IcuLocaleProvider : public ILocaleProvider
{
public:
    /// `default_tag` overrides ICU's process default locale; leave empty to
    /// use ICU's own default (falls back to "en-US" if that is unusable).
    explicit IcuLocaleProvider(std::string default_tag = "");

    [[nodiscard]] bool isSupported(const std::string& tag) const override;
    [[nodiscard]] std::string defaultLocale() const override;
    [[nodiscard]] std::optional<std::string> formatDecimal(double value, const std::string& tag,
                                                           const DecimalStyle& style) const override;
    [[nodiscard]] std::optional<std::vector<NumberPart>> formatToParts(double value, const std::string& tag,
                                                                       const DecimalStyle& style) const override;

private:
    std::string default_tag_;
};

} // namespace l10n
