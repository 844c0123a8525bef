#pragma once

#include "FormatOptions.hpp"
#include "NumberFormatter.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace numfmt
{

/// A number format the user can pick in settings.
struct FormatPreset
{
    std::string locale;
    std::string label; // Static sample, e.g. "1.234,56"
    double sample;     // Value the label shows
};

/// en-US, de-DE, fr-FR, de-CH, en-IN, in display order.
[[nodiscard]] const std::vector<FormatPreset>& formatPresets();

[[nodiscard]] bool isKnownPreset(std::string_view locale);

struct PresetPreview
{
    std::string locale;
    std::string preview;
};

/// Renders each preset's sample with the live formatter so labels follow the
/// installed locale data (e.g. the narrow no-break space of fr-FR).
[[nodiscard]] std::vector<PresetPreview> presetPreviews(const NumberFormatter& formatter,
                                                        const FormatOptions& options = FormatOptions());

} // namespace numfmt
