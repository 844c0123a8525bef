#include <catch2/catch_test_macros.hpp>
#include "numfmt/NumberTextService.hpp"
#include "utils/synthetic_locale_provider.hpp"

#include <cmath>
#include <string>

using namespace numfmt;
using config::NumberFormatSettings;
using currency::CurrencyRegistry;
using test_utils::SyntheticLocaleProvider;

namespace {

std::string bullets(std::size_t count) {
    std::string out;
    for (std::size_t i = 0; i < count; ++i)
        out += "\xE2\x80\xA2";
    return out;
}

} // namespace

TEST_CASE("NumberTextService - Direct operations", "[service]") {
    SyntheticLocaleProvider provider;
    NumberTextService service(provider, CurrencyRegistry::builtin());

    REQUIRE(service.format(-1234.5, "de-DE", FormatOptions::currency("EUR")) == "-1.234,50 \xE2\x82\xAC");
    REQUIRE(service.parse("-1.234,50 \xE2\x82\xAC", "de-DE") == -1234.5);
    REQUIRE(service.normalizeForExport("1,234.56") == "1234.56");
    REQUIRE(service.normalizeForExport(-1234.5) == "-1234.5");
    REQUIRE(service.mask(-1234.56, "en-US", FormatOptions::currency("USD"), true) == "-$" + bullets(8));
    REQUIRE(service.formatDetailed(1.0, "zz-ZZ", FormatOptions::decimal()).tier == FormatTier::DefaultLocale);
}

TEST_CASE("NumberTextService - Display follows the settings", "[service][settings]") {
    SyntheticLocaleProvider provider;
    NumberTextService service(provider, CurrencyRegistry::builtin());
    NumberFormatSettings settings; // en-US, USD

    SECTION("Currency style without a code uses the active currency") {
        REQUIRE(service.formatForDisplay(1234.56, settings, FormatOptions::currency()) == "$1,234.56");

        settings.locale = "de-DE";
        settings.currency = "EUR";
        REQUIRE(service.formatForDisplay(1234.56, settings, FormatOptions::currency()) == "1.234,56 \xE2\x82\xAC");
    }

    SECTION("Empty active currency means USD") {
        settings.currency.clear();
        REQUIRE(service.formatForDisplay(-5.0, settings, FormatOptions::currency()) == "-$5.00");
    }

    SECTION("Explicit code wins over the active currency") {
        settings.currency = "EUR";
        REQUIRE(service.formatForDisplay(5.0, settings, FormatOptions::currency("GBP")) == "\xC2\xA3" "5.00");
    }

    SECTION("Decimal style by default") {
        settings.locale = "de-CH";
        REQUIRE(service.formatForDisplay(1234.56, settings) == "1'234.56");
        REQUIRE(service.formatForDisplay(std::nullopt, settings).empty());
    }

    SECTION("A changed setting applies to the next call") {
        REQUIRE(service.formatForDisplay(1234.56, settings) == "1,234.56");
        settings.locale = "fr-FR";
        REQUIRE(service.formatForDisplay(1234.56, settings) == "1\xE2\x80\xAF" "234,56");
    }

    SECTION("Parsing uses the settings locale") {
        settings.locale = "de-DE";
        REQUIRE(service.parseForDisplay("1.234,56", settings) == 1234.56);
        REQUIRE(std::isnan(service.parseForDisplay("", settings)));
    }
}

TEST_CASE("NumberTextService - Privacy mode", "[service][masker]") {
    SyntheticLocaleProvider provider;
    NumberTextService service(provider, CurrencyRegistry::builtin());
    NumberFormatSettings settings;
    settings.privacy_mode = true;

    SECTION("Values are masked") {
        REQUIRE(service.formatForDisplay(1234.56, settings) == bullets(8));
        REQUIRE(service.formatForDisplay(-1234.56, settings, FormatOptions::currency()) == "-$" + bullets(8));
    }

    SECTION("ignore_privacy shows the digits") {
        REQUIRE(service.formatForDisplay(1234.56, settings, FormatOptions::currency(), { .ignore_privacy = true }) ==
                "$1,234.56");
    }

    SECTION("Unknown code falls back to the active currency's symbol") {
        settings.currency = "EUR";
        REQUIRE(service.formatForDisplay(10.0, settings, FormatOptions::currency("XTS")) ==
                bullets(5) + " \xE2\x82\xAC");
    }

    SECTION("Unknown code and unknown active currency show the code") {
        settings.currency = "ZZZ";
        REQUIRE(service.formatForDisplay(10.0, settings, FormatOptions::currency("XTS")) == "XTS" + bullets(5));
    }

    SECTION("Glyph count follows the locale") {
        settings.locale = "en-IN";
        REQUIRE(service.formatForDisplay(123456.78, settings) == bullets(11)); // 1,23,456.78
    }

    SECTION("Turning privacy off restores the text") {
        settings.privacy_mode = false;
        REQUIRE(service.formatForDisplay(1234.56, settings) == "1,234.56");
    }
}

TEST_CASE("NumberTextService - Export policy", "[service][export]") {
    SyntheticLocaleProvider provider;

    NumberTextService position_based(provider, CurrencyRegistry::builtin());
    REQUIRE(position_based.normalizeForExport("1.234,56") == "1234.56");

    NumberTextService legacy(provider, CurrencyRegistry::builtin(), MixedSeparatorPolicy::CommaIsGrouping);
    REQUIRE(legacy.normalizer().policy() == MixedSeparatorPolicy::CommaIsGrouping);
    REQUIRE(legacy.normalizeForExport("1.234,56") == "1.23456");
}
