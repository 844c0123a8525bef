#include "FormatPresets.hpp"

#include <algorithm>

namespace numfmt
{

const std::vector<FormatPreset>& formatPresets()
{
    static const std::vector<FormatPreset> presets = {
        { "en-US", "1,234.56", 1234.56 },
        { "de-DE", "1.234,56", 1234.56 },
        { "fr-FR", "1 234,56", 1234.56 },
        { "de-CH", "1'234.56", 1234.56 },
        { "en-IN", "1,23,456.78", 123456.78 },
    };
    return presets;
}

bool isKnownPreset(std::string_view locale)
{
    const auto& presets = formatPresets();
    return std::any_of(presets.begin(), presets.end(),
                       [&](const FormatPreset& preset) { return preset.locale == locale; });
}

std::vector<PresetPreview> presetPreviews(const NumberFormatter& formatter, const FormatOptions& options)
{
    std::vector<PresetPreview> previews;
    previews.reserve(formatPresets().size());
    for (const auto& preset : formatPresets())
    {
        FormatResult rendered = formatter.formatDetailed(preset.sample, preset.locale, options);
        // Without locale data the static label is more useful than fixed-point text
        previews.push_back({ preset.locale, rendered.tier == FormatTier::Native ? rendered.text : preset.label });
    }
    return previews;
}

} // namespace numfmt
