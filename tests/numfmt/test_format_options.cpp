#include <catch2/catch_test_macros.hpp>
#include "numfmt/FormatOptions.hpp"

#include <stdexcept>
#include <utility>

using numfmt::FormatOptions;
using numfmt::NumberStyle;

TEST_CASE("FormatOptions - Defaults", "[options]") {
    FormatOptions options;
    REQUIRE(options.style() == NumberStyle::Decimal);
    REQUIRE_FALSE(options.currencyCode().has_value());
    REQUIRE(options.minFractionDigits() == 2);
    REQUIRE(options.maxFractionDigits() == 2);
    REQUIRE(options.useGrouping());
    REQUIRE(options == FormatOptions::decimal());
}

TEST_CASE("FormatOptions - Fraction digit bounds are validated", "[options]") {
    SECTION("max below min") {
        REQUIRE_THROWS_AS(FormatOptions::decimal(3, 1), std::invalid_argument);
        REQUIRE_THROWS_AS(FormatOptions(NumberStyle::Currency, "USD", 2, 0), std::invalid_argument);
    }

    SECTION("max above the supported maximum") {
        REQUIRE_THROWS_AS(FormatOptions::decimal(0, FormatOptions::kMaxFractionDigits + 1), std::invalid_argument);
        REQUIRE_NOTHROW(FormatOptions::decimal(0, FormatOptions::kMaxFractionDigits));
    }

    SECTION("Equal bounds") {
        REQUIRE_NOTHROW(FormatOptions::decimal(0, 0));
        REQUIRE_NOTHROW(FormatOptions::currency("EUR", 4, 4));
    }
}

TEST_CASE("FormatOptions - Currency helpers", "[options]") {
    SECTION("Empty code means no code") {
        auto options = FormatOptions::currency();
        REQUIRE(options.isCurrency());
        REQUIRE_FALSE(options.currencyCode().has_value());
    }

    SECTION("withCurrency keeps digits and grouping") {
        auto options = FormatOptions::decimal(0, 3, false).withCurrency("JPY");
        REQUIRE(options.isCurrency());
        REQUIRE(options.currencyCode() == "JPY");
        REQUIRE(options.minFractionDigits() == 0);
        REQUIRE(options.maxFractionDigits() == 3);
        REQUIRE_FALSE(options.useGrouping());
    }

    SECTION("asDecimal drops style and code") {
        auto options = FormatOptions::currency("EUR", 1, 4).asDecimal();
        REQUIRE(options == FormatOptions::decimal(1, 4));
    }

    SECTION("decimalStyle carries the digits") {
        auto style = FormatOptions::currency("EUR", 0, 3, false).decimalStyle();
        REQUIRE(style.min_fraction_digits == 0);
        REQUIRE(style.max_fraction_digits == 3);
        REQUIRE_FALSE(style.use_grouping);
    }
}

TEST_CASE("FormatOptions - Reading digit bounds", "[options][cli]") {
    using numfmt::parseFractionDigits;

    SECTION("Single bound and range") {
        REQUIRE(parseFractionDigits("3") == std::make_pair(3u, 3u));
        REQUIRE(parseFractionDigits("0:4") == std::make_pair(0u, 4u));
        REQUIRE(parseFractionDigits("20") == std::make_pair(20u, 20u));
    }

    SECTION("Reversed bounds are left to the constructor") {
        auto digits = parseFractionDigits("4:1");
        REQUIRE(digits.has_value());
        REQUIRE_THROWS_AS(FormatOptions::decimal(digits->first, digits->second), std::invalid_argument);
    }

    SECTION("Out of range values do not wrap") {
        REQUIRE_FALSE(parseFractionDigits("21").has_value());
        REQUIRE_FALSE(parseFractionDigits("4294967298").has_value());
        REQUIRE_FALSE(parseFractionDigits("2:4294967298").has_value());
        REQUIRE_FALSE(parseFractionDigits("99999999999999999999999").has_value());
    }

    SECTION("Malformed text") {
        REQUIRE_FALSE(parseFractionDigits("").has_value());
        REQUIRE_FALSE(parseFractionDigits("-1").has_value());
        REQUIRE_FALSE(parseFractionDigits("2:").has_value());
        REQUIRE_FALSE(parseFractionDigits("two").has_value());
        REQUIRE_FALSE(parseFractionDigits("2x").has_value());
    }
}
