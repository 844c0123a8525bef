// Catch2WithMain provides main(); shared test doubles live in tests/utils/

#include <catch2/catch_test_macros.hpp>
#include "currency/CurrencyRegistry.hpp"

// Links against the core library and reaches its static data
TEST_CASE("Framework smoke test", "[smoke]") {
    REQUIRE(currency::CurrencyRegistry::builtin().count() > 0);
}
