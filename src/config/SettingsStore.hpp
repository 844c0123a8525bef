#pragma once

#include "NumberFormatSettings.hpp"

#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

namespace config
{

/// Reads and writes the library's tables of config.toml:
///
///   [number_format]  locale, currency, privacy_mode, default_locale,
///                    currency_file, mixed_separator_policy
///   [app.debug]      verbose_diagnostics
///
/// Invalid values keep their defaults and are reported as Configuration
/// warnings; a missing file is not an error.
class SettingsStore
{
public:
    explicit SettingsStore(std::string config_path = "config.toml");

    bool load();
    bool loadFromString(std::string_view document);
    bool reloadIfChanged();
    bool save();

    [[nodiscard]] const LibrarySettings& settings() const { return settings_; }
    [[nodiscard]] const NumberFormatSettings& numberFormat() const { return settings_.number_format; }
    void setNumberFormat(NumberFormatSettings number_format) { settings_.number_format = std::move(number_format); }

    [[nodiscard]] const std::string& path() const { return config_path_; }
    [[nodiscard]] const char* lastError() const { return last_error_.c_str(); }

private:
    void apply(const toml::table& root);

    std::string config_path_;
    std::string last_error_;
    long long last_mtime_ = 0;
    toml::table root_; // Last document read; foreign tables survive save()
    LibrarySettings settings_;
};

} // namespace config
