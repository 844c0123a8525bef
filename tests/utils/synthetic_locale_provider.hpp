#pragma once

#include "l10n/ILocaleProvider.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace test_utils {

// Separator conventions of a synthetic locale
struct SyntheticLocale {
    std::string group = ",";
    std::string decimal = ".";
    std::string minus = "-";
    bool indian_grouping = false; // 3 digits, then groups of 2 ("1,23,456")
    std::vector<std::string> digits; // glyphs for 0-9, empty for ASCII
};

// Deterministic ILocaleProvider for tests, independent of the ICU data
// installed on the machine.
//
// Ships en-US, de-DE, fr-FR (narrow no-break space), de-CH (apostrophe)
// and en-IN. Default locale is en-US unless changed.
class SyntheticLocaleProvider : public l10n::ILocaleProvider {
public:
    SyntheticLocaleProvider();

    // Add or replace a locale
    void addLocale(const std::string& tag, SyntheticLocale locale);

    // Drop every locale, including the built-in ones
    void clearLocales();

    // May name an unsupported tag to simulate a broken runtime default
    void setDefaultLocale(std::string tag);

    // When false, formatToParts fails for every locale (formatDecimal still works)
    void setPartsAvailable(bool available);

    bool isSupported(const std::string& tag) const override;
    std::string defaultLocale() const override;
    std::optional<std::string> formatDecimal(double value, const std::string& tag,
                                             const l10n::DecimalStyle& style) const override;
    std::optional<std::vector<l10n::NumberPart>> formatToParts(double value, const std::string& tag,
                                                               const l10n::DecimalStyle& style) const override;

private:
    std::optional<std::vector<l10n::NumberPart>> render(double value, const std::string& tag,
                                                        const l10n::DecimalStyle& style) const;

    std::map<std::string, SyntheticLocale> locales_;
    std::string default_locale_ = "en-US";
    bool parts_available_ = true;
};

// U+202F NARROW NO-BREAK SPACE, the group separator of fr-FR
inline constexpr const char* kNarrowNbsp = "\xE2\x80\xAF";

// Extended Arabic-Indic digits U+06F0..U+06F9 with the Arabic separators,
// as fa-IR writes numbers
SyntheticLocale persianLocale();

} // namespace test_utils
