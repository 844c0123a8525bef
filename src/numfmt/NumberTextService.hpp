#pragma once

#include "ExportNormalizer.hpp"
#include "FormatOptions.hpp"
#include "FormatResult.hpp"
#include "NumberFormatter.hpp"
#include "NumberParser.hpp"
#include "PrivacyMasker.hpp"
#include "../config/NumberFormatSettings.hpp"
#include "../currency/CurrencyRegistry.hpp"
#include "../l10n/ILocaleProvider.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace numfmt
{

struct DisplayFlags
{
    bool ignore_privacy = false; // Show real digits even in privacy mode
};

/**
 * @brief Entry point for hosts: formatting, parsing, export normalisation
 * and masking behind one object.
 *
 * The active preference (locale, currency, privacy flag) is never stored
 * here; it arrives with every call, so a changed setting applies to the
 * very next call. All members are const and safe to share across threads.
 */
class NumberTextService
{
public:
    NumberTextService(const l10n::ILocaleProvider& provider, const currency::CurrencyRegistry& registry,
                      MixedSeparatorPolicy export_policy = MixedSeparatorPolicy::LastIsDecimal);

    NumberTextService(const NumberTextService&) = delete;
    NumberTextService& operator=(const NumberTextService&) = delete;

    [[nodiscard]] std::string format(std::optional<double> value, const std::string& locale,
                                     const FormatOptions& options) const;
    [[nodiscard]] FormatResult formatDetailed(std::optional<double> value, const std::string& locale,
                                              const FormatOptions& options) const;

    [[nodiscard]] double parse(std::string_view text, const std::string& locale) const;

    [[nodiscard]] std::string normalizeForExport(std::string_view text) const;
    [[nodiscard]] std::string normalizeForExport(double value) const;

    [[nodiscard]] std::string mask(std::optional<double> value, const std::string& locale,
                                   const FormatOptions& options, bool is_currency) const;

    /// Formats for on-screen display under the given settings. Currency
    /// style without a code uses the settings' currency ("USD" when unset);
    /// privacy mode masks unless `flags.ignore_privacy`.
    [[nodiscard]] std::string formatForDisplay(std::optional<double> value, const config::NumberFormatSettings& settings,
                                               const FormatOptions& options = FormatOptions(),
                                               DisplayFlags flags = {}) const;

    [[nodiscard]] double parseForDisplay(std::string_view text, const config::NumberFormatSettings& settings) const;

    [[nodiscard]] const NumberFormatter& formatter() const { return formatter_; }
    [[nodiscard]] const NumberParser& parser() const { return parser_; }
    [[nodiscard]] const ExportNormalizer& normalizer() const { return normalizer_; }
    [[nodiscard]] const PrivacyMasker& masker() const { return masker_; }

private:
    NumberFormatter formatter_;
    NumberParser parser_;
    ExportNormalizer normalizer_;
    PrivacyMasker masker_; // References formatter_
};

} // namespace numfmt
