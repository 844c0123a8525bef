#include "synthetic_locale_provider.hpp"
#include "numfmt/TextUtils.hpp"

#include <cmath>
#include <utility>

namespace test_utils {

namespace {

std::string localizeDigits(const std::string& ascii, const SyntheticLocale& locale) {
    if (locale.digits.size() != 10)
        return ascii;
    std::string out;
    for (char c : ascii) {
        if (c >= '0' && c <= '9')
            out += locale.digits[static_cast<std::size_t>(c - '0')];
        else
            out += c;
    }
    return out;
}

} // namespace

SyntheticLocale persianLocale() {
    SyntheticLocale locale{ "\xD9\xAC", "\xD9\xAB", "\xE2\x88\x92", false }; // U+066C, U+066B, U+2212
    for (int d = 0; d < 10; ++d) {
        const char glyph[] = { '\xDB', static_cast<char>(0xB0 + d), '\0' };
        locale.digits.emplace_back(glyph);
    }
    return locale;
}

SyntheticLocaleProvider::SyntheticLocaleProvider() {
    locales_["en-US"] = SyntheticLocale{ ",", ".", "-", false };
    locales_["de-DE"] = SyntheticLocale{ ".", ",", "-", false };
    locales_["fr-FR"] = SyntheticLocale{ kNarrowNbsp, ",", "-", false };
    locales_["de-CH"] = SyntheticLocale{ "'", ".", "-", false };
    locales_["en-IN"] = SyntheticLocale{ ",", ".", "-", true };
}

void SyntheticLocaleProvider::addLocale(const std::string& tag, SyntheticLocale locale) {
    locales_[tag] = std::move(locale);
}

void SyntheticLocaleProvider::clearLocales() {
    locales_.clear();
}

void SyntheticLocaleProvider::setDefaultLocale(std::string tag) {
    default_locale_ = std::move(tag);
}

void SyntheticLocaleProvider::setPartsAvailable(bool available) {
    parts_available_ = available;
}

bool SyntheticLocaleProvider::isSupported(const std::string& tag) const {
    return locales_.count(tag) > 0;
}

std::string SyntheticLocaleProvider::defaultLocale() const {
    return default_locale_;
}

std::optional<std::string> SyntheticLocaleProvider::formatDecimal(double value, const std::string& tag,
                                                                  const l10n::DecimalStyle& style) const {
    auto parts = render(value, tag, style);
    if (!parts)
        return std::nullopt;

    std::string text;
    for (const auto& part : *parts)
        text += part.value;
    return text;
}

std::optional<std::vector<l10n::NumberPart>> SyntheticLocaleProvider::formatToParts(
    double value, const std::string& tag, const l10n::DecimalStyle& style) const {
    if (!parts_available_)
        return std::nullopt;
    return render(value, tag, style);
}

std::optional<std::vector<l10n::NumberPart>> SyntheticLocaleProvider::render(
    double value, const std::string& tag, const l10n::DecimalStyle& style) const {
    auto it = locales_.find(tag);
    if (it == locales_.end() || !std::isfinite(value))
        return std::nullopt;
    const SyntheticLocale& locale = it->second;

    std::string digits = numfmt::fixedPointText(std::fabs(value), style.max_fraction_digits);
    std::string integer = digits;
    std::string fraction;
    if (auto dot = digits.find('.'); dot != std::string::npos) {
        integer = digits.substr(0, dot);
        fraction = digits.substr(dot + 1);
    }
    while (fraction.size() > style.min_fraction_digits && !fraction.empty() && fraction.back() == '0')
        fraction.pop_back();

    std::vector<l10n::NumberPart> parts;
    if (value < 0)
        parts.push_back({ l10n::PartType::MinusSign, locale.minus });

    if (!style.use_grouping || integer.size() <= 3) {
        parts.push_back({ l10n::PartType::Integer, localizeDigits(integer, locale) });
    } else {
        // Split from the right: first group of 3, then 3 (or 2 for Indian)
        std::vector<std::string> groups;
        std::string rest = integer;
        std::size_t size = 3;
        while (rest.size() > size) {
            groups.insert(groups.begin(), rest.substr(rest.size() - size));
            rest.erase(rest.size() - size);
            size = locale.indian_grouping ? 2 : 3;
        }
        groups.insert(groups.begin(), rest);

        for (std::size_t i = 0; i < groups.size(); ++i) {
            if (i > 0)
                parts.push_back({ l10n::PartType::Group, locale.group });
            parts.push_back({ l10n::PartType::Integer, localizeDigits(groups[i], locale) });
        }
    }

    if (!fraction.empty()) {
        parts.push_back({ l10n::PartType::Decimal, locale.decimal });
        parts.push_back({ l10n::PartType::Fraction, localizeDigits(fraction, locale) });
    }
    return parts;
}

} // namespace test_utils
