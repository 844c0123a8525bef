#pragma once

#include "../numfmt/ExportNormalizer.hpp"

#include <string>

namespace config
{

/// User preference for number display. Owned by the host; passed to the
/// library on every call.
struct NumberFormatSettings
{
    std::string locale = "en-US";
    std::string currency = "USD";
    bool privacy_mode = false;

    bool operator==(const NumberFormatSettings& other) const = default;
};

/// Everything config.toml can set for the library.
struct LibrarySettings
{
    NumberFormatSettings number_format;
    std::string default_locale;          // Overrides the runtime default locale when set
    std::string currency_file;           // JSON dataset merged over the built-in table
    numfmt::MixedSeparatorPolicy export_policy = numfmt::MixedSeparatorPolicy::LastIsDecimal;
    bool verbose_diagnostics = false;
};

} // namespace config
