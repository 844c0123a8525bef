#include <catch2/catch_test_macros.hpp>
#include "numfmt/PrivacyMasker.hpp"
#include "numfmt/TextUtils.hpp"
#include "utils/synthetic_locale_provider.hpp"

#include <cmath>
#include <limits>
#include <string>

using namespace numfmt;
using currency::CurrencyRegistry;
using test_utils::SyntheticLocaleProvider;

namespace {

std::string bullets(std::size_t count) {
    std::string out;
    for (std::size_t i = 0; i < count; ++i)
        out += "\xE2\x80\xA2";
    return out;
}

// Length of the first run of filler glyphs
std::size_t maskedRunLength(const std::string& masked) {
    std::size_t count = 0;
    std::size_t pos = masked.find("\xE2\x80\xA2");
    while (pos != std::string::npos && masked.compare(pos, 3, "\xE2\x80\xA2") == 0) {
        ++count;
        pos += 3;
    }
    return count;
}

} // namespace

TEST_CASE("PrivacyMasker - Masking formatted text", "[masker]") {
    const CurrencyRegistry& registry = CurrencyRegistry::builtin();

    SECTION("Plain numbers") {
        REQUIRE(PrivacyMasker::mask("1,234.56", false, nullptr) == bullets(8));
        REQUIRE(PrivacyMasker::mask("-1,234.56", false, nullptr) == "-" + bullets(8));
        REQUIRE(PrivacyMasker::mask("+5", false, nullptr) == bullets(1));
        REQUIRE(PrivacyMasker::mask("\xE2\x88\x92" "3,5", false, nullptr) == "\xE2\x88\x92" + bullets(3));
    }

    SECTION("Empty text still shows one glyph") {
        REQUIRE(PrivacyMasker::mask("", false, nullptr) == bullets(1));
        REQUIRE(PrivacyMasker::filler(0) == bullets(1));
    }

    SECTION("Currency symbols stay in place") {
        REQUIRE(PrivacyMasker::mask("-1,234.56", true, registry.find("USD")) == "-$" + bullets(8));
        REQUIRE(PrivacyMasker::mask("1.234,56", true, registry.find("EUR")) == bullets(8) + " \xE2\x82\xAC");
        REQUIRE(PrivacyMasker::mask("10", true, nullptr) == "\xC2\xA4" + bullets(2));
    }

    SECTION("Narrow no-break space counts as one character") {
        REQUIRE(PrivacyMasker::mask("1\xE2\x80\xAF" "234,56", false, nullptr) == bullets(8));
    }
}

TEST_CASE("PrivacyMasker - Masked run matches the formatted run", "[masker][length]") {
    SyntheticLocaleProvider provider;
    NumberFormatter formatter(provider, CurrencyRegistry::builtin());
    PrivacyMasker masker(formatter);

    const double values[] = { 0.0, 1234.56, -1234.56, 0.001 };
    const FormatOptions digit_options[] = { FormatOptions::decimal(2, 2), FormatOptions::decimal(0, 0) };
    const char* locales[] = { "en-US", "fr-FR", "en-IN" };

    for (const char* locale : locales) {
        for (const auto& options : digit_options) {
            for (double value : values) {
                const std::string unmasked = formatter.format(std::fabs(value), locale, options);
                const std::size_t expected = countCodepoints(unmasked);
                INFO(locale << " max=" << options.maxFractionDigits() << " value=" << value << " unmasked="
                            << unmasked);

                const std::string plain = masker.maskValue(value, locale, options, false);
                REQUIRE(maskedRunLength(plain) == expected);
                REQUIRE((plain.front() == '-') == (value < 0));

                const auto currency_options = options.withCurrency("EUR");
                const std::string money = masker.maskValue(value, locale, currency_options, true);
                REQUIRE(maskedRunLength(money) == expected);
                REQUIRE(money.substr(money.size() - 4) == " \xE2\x82\xAC");
            }
        }
    }
}

TEST_CASE("PrivacyMasker - Known lengths", "[masker][length]") {
    SyntheticLocaleProvider provider;
    NumberFormatter formatter(provider, CurrencyRegistry::builtin());
    PrivacyMasker masker(formatter);

    REQUIRE(masker.maskValue(0.0, "en-US", FormatOptions::decimal(2, 2), false) == bullets(4));       // 0.00
    REQUIRE(masker.maskValue(0.001, "en-US", FormatOptions::decimal(2, 2), false) == bullets(4));     // 0.00
    REQUIRE(masker.maskValue(0.001, "en-US", FormatOptions::decimal(0, 0), false) == bullets(1));     // 0
    REQUIRE(masker.maskValue(-1234.56, "en-US", FormatOptions::decimal(0, 0), false) == "-" + bullets(5)); // 1,235
    REQUIRE(masker.maskValue(-1234.56, "en-US", FormatOptions::currency("USD"), true) == "-$" + bullets(8));
}

TEST_CASE("PrivacyMasker - Locale minus sign", "[masker][sign]") {
    SyntheticLocaleProvider provider;
    provider.addLocale("sv-SE", test_utils::SyntheticLocale{ test_utils::kNarrowNbsp, ",", "\xE2\x88\x92", false });
    NumberFormatter formatter(provider, CurrencyRegistry::builtin());
    PrivacyMasker masker(formatter);

    const auto options = FormatOptions::decimal(1, 1);
    const std::string formatted = formatter.format(-1234.5, "sv-SE", options);
    REQUIRE(formatted.rfind("\xE2\x88\x92", 0) == 0);

    // Decimal masks keep the sign the locale renders
    REQUIRE(masker.maskValue(-1234.5, "sv-SE", options, false) == "\xE2\x88\x92" + bullets(7)); // 1 234,5

    // Currency strings are composed with '-'
    REQUIRE(masker.maskValue(-1234.5, "sv-SE", options.withCurrency("EUR"), true) ==
            "-" + bullets(7) + " \xE2\x82\xAC");
}

TEST_CASE("PrivacyMasker - Currency resolution", "[masker][currency]") {
    SyntheticLocaleProvider provider;
    NumberFormatter formatter(provider, CurrencyRegistry::builtin());
    PrivacyMasker masker(formatter);

    SECTION("Unknown code is shown as the symbol") {
        REQUIRE(masker.maskValue(10.0, "en-US", FormatOptions::currency("XTS"), true) == "XTS" + bullets(5));
    }

    SECTION("No code uses the generic sign") {
        REQUIRE(masker.maskValue(10.0, "en-US", FormatOptions::currency(), true) == "\xC2\xA4" + bullets(5));
    }

    SECTION("Caller supplied definition") {
        currency::CurrencyDefinition def{ "PTS", "pts", "Points", currency::SymbolPosition::Trailing };
        REQUIRE(masker.maskValue(-7.0, "en-US", FormatOptions::currency("PTS"), def) == "-" + bullets(4) + " pts");
    }
}

TEST_CASE("PrivacyMasker - Absent values", "[masker]") {
    SyntheticLocaleProvider provider;
    NumberFormatter formatter(provider, CurrencyRegistry::builtin());
    PrivacyMasker masker(formatter);

    REQUIRE(masker.maskValue(std::nullopt, "en-US", FormatOptions::decimal(), false) == bullets(1));
    REQUIRE(masker.maskValue(std::numeric_limits<double>::quiet_NaN(), "en-US", FormatOptions::decimal(), false) ==
            bullets(1));
    REQUIRE(masker.maskValue(std::nullopt, "en-US", FormatOptions::currency("USD"), true) == "$" + bullets(1));
}
