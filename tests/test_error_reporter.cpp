#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace utils;

TEST_CASE("ErrorReporter - Queue", "[errors]") {
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    ErrorReporter::ReportWarning(ErrorCategory::CurrencyData, "Currency list could not be loaded", "missing.json");
    ErrorReporter::ReportError(ErrorCategory::Configuration, "Failed to save number format settings");

    REQUIRE(ErrorReporter::HasPendingErrors());
    auto last = ErrorReporter::GetLastError();
    REQUIRE(last.category == ErrorCategory::Configuration);
    REQUIRE(last.severity == ErrorSeverity::Error);
    REQUIRE_FALSE(last.is_fatal);
    REQUIRE_FALSE(last.timestamp.empty());

    auto pending = ErrorReporter::GetPendingErrors();
    REQUIRE(pending.size() == 2);
    REQUIRE(pending[0].technical_details == "missing.json");
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
}

TEST_CASE("ErrorReporter - Fatal flag and names", "[errors]") {
    ErrorReporter::ClearErrors();
    ErrorReporter::ReportError(ErrorCategory::Initialization, ErrorSeverity::Fatal, "Cannot start");
    REQUIRE(ErrorReporter::GetLastError().is_fatal);
    ErrorReporter::ClearErrors();

    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::CurrencyData) == "Currency Data");
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Locale) == "Locale");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Warning) == "Warning");
    REQUIRE(ErrorReporter::GetLastError().category == ErrorCategory::Unknown);

    ErrorReport report(ErrorCategory::CurrencyData, ErrorSeverity::Warning, "Currency list could not be loaded",
                       "missing.json");
    REQUIRE(ErrorReporter::FormatReport(report) ==
            "Warning [Currency Data] Currency list could not be loaded: missing.json");
    report.technical_details.clear();
    REQUIRE(ErrorReporter::FormatReport(report) == "Warning [Currency Data] Currency list could not be loaded");
}

TEST_CASE("ErrorReporter - Bounded queue under concurrent reports", "[errors]") {
    ErrorReporter::ClearErrors();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 50; ++i) {
                ErrorReporter::ReportWarning(ErrorCategory::Locale, "thread " + std::to_string(t));
            }
        });
    }
    for (auto& thread : threads)
        thread.join();

    auto pending = ErrorReporter::GetPendingErrors();
    REQUIRE(pending.size() == 100);
}
