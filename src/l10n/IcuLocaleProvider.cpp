#include "IcuLocaleProvider.hpp"
#include "../numfmt/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <cstdint>
#include <unordered_set>
#include <utility>

#include <plog/Log.h>
#include <unicode/locid.h>
#include <unicode/numberformatter.h>
#include <unicode/numfmt.h>
#include <unicode/unistr.h>
#include <unicode/unum.h>
#include <unicode/utypes.h>

namespace l10n
{

namespace
{

constexpr const char* kLastResortTag = "en-US";

// Languages ICU ships number data for. Built once; read-only afterwards.
const std::unordered_set<std::string>& availableLanguages()
{
    static const std::unordered_set<std::string> languages = []
    {
        std::unordered_set<std::string> result;
        int32_t count = 0;
        const icu::Locale* locales = icu::NumberFormat::getAvailableLocales(count);
        for (int32_t i = 0; i < count; ++i)
        {
            result.insert(locales[i].getLanguage());
        }
        return result;
    }();
    return languages;
}

std::optional<icu::Locale> toIcuLocale(const std::string& tag)
{
    if (tag.empty())
        return std::nullopt;

    UErrorCode status = U_ZERO_ERROR;
    icu::Locale locale = icu::Locale::forLanguageTag(tag, status);
    if (U_FAILURE(status) || locale.isBogus())
        return std::nullopt;

    const char* language = locale.getLanguage();
    if (language == nullptr || *language == '\0')
        return std::nullopt;
    if (availableLanguages().count(language) == 0)
        return std::nullopt;
    return locale;
}

icu::number::LocalizedNumberFormatter makeFormatter(const icu::Locale& locale, const DecimalStyle& style)
{
    return icu::number::NumberFormatter::withLocale(locale)
        .precision(icu::number::Precision::minMaxFraction(static_cast<int32_t>(style.min_fraction_digits),
                                                          static_cast<int32_t>(style.max_fraction_digits)))
        .grouping(style.use_grouping ? UNUM_GROUPING_AUTO : UNUM_GROUPING_OFF)
        .roundingMode(UNUM_ROUND_HALFUP);
}

PartType signPartType(const icu::UnicodeString& text, int32_t start)
{
    return text.charAt(start) == u'+' ? PartType::PlusSign : PartType::MinusSign;
}

} // namespace

IcuLocaleProvider::IcuLocaleProvider(std::string default_tag)
    : default_tag_(std::move(default_tag))
{
    if (!default_tag_.empty() && !isSupported(default_tag_))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Locale,
                                            "Default locale is not available, using the system locale", default_tag_);
    }
}

bool IcuLocaleProvider::isSupported(const std::string& tag) const { return toIcuLocale(tag).has_value(); }

std::string IcuLocaleProvider::defaultLocale() const
{
    if (!default_tag_.empty() && isSupported(default_tag_))
        return default_tag_;

    UErrorCode status = U_ZERO_ERROR;
    std::string tag = icu::Locale::getDefault().toLanguageTag<std::string>(status);
    if (U_FAILURE(status) || !isSupported(tag))
        return kLastResortTag;
    return tag;
}

std::optional<std::string> IcuLocaleProvider::formatDecimal(double value, const std::string& tag,
                                                            const DecimalStyle& style) const
{
    auto locale = toIcuLocale(tag);
    if (!locale)
        return std::nullopt;

    UErrorCode status = U_ZERO_ERROR;
    icu::number::FormattedNumber formatted = makeFormatter(*locale, style).formatDouble(value, status);
    icu::UnicodeString text = formatted.toString(status);
    if (U_FAILURE(status))
    {
        PLOG_WARNING << "IcuLocaleProvider: formatting failed for " << tag << ": " << u_errorName(status);
        return std::nullopt;
    }

    std::string out;
    text.toUTF8String(out);
    return out;
}

std::optional<std::vector<NumberPart>> IcuLocaleProvider::formatToParts(double value, const std::string& tag,
                                                                        const DecimalStyle& style) const
{
    auto locale = toIcuLocale(tag);
    if (!locale)
        return std::nullopt;

    UErrorCode status = U_ZERO_ERROR;
    icu::number::FormattedNumber formatted = makeFormatter(*locale, style).formatDouble(value, status);
    icu::UnicodeString text = formatted.toString(status);
    if (U_FAILURE(status))
    {
        PLOG_WARNING << "IcuLocaleProvider: formatting failed for " << tag << ": " << u_errorName(status);
        return std::nullopt;
    }

    struct Span
    {
        int32_t field;
        int32_t start;
        int32_t limit;
    };
    std::vector<Span> spans;

    icu::ConstrainedFieldPosition cfpos;
    cfpos.constrainCategory(UFIELD_CATEGORY_NUMBER);
    while (formatted.nextPosition(cfpos, status))
    {
        spans.push_back({ cfpos.getField(), cfpos.getStart(), cfpos.getLimit() });
    }
    if (U_FAILURE(status))
    {
        PLOG_WARNING << "IcuLocaleProvider: field iteration failed for " << tag << ": " << u_errorName(status);
        return std::nullopt;
    }

    // Integer spans enclose their grouping separators, so paint outer fields
    // first and let the nested ones overwrite them.
    auto rank = [](int32_t field)
    {
        switch (field)
        {
        case UNUM_INTEGER_FIELD:
        case UNUM_FRACTION_FIELD:
            return 0;
        default:
            return 1;
        }
    };
    std::stable_sort(spans.begin(), spans.end(),
                     [&](const Span& a, const Span& b) { return rank(a.field) < rank(b.field); });

    std::vector<PartType> types(static_cast<std::size_t>(text.length()), PartType::Literal);
    for (const auto& span : spans)
    {
        PartType type = PartType::Literal;
        switch (span.field)
        {
        case UNUM_INTEGER_FIELD:
            type = PartType::Integer;
            break;
        case UNUM_FRACTION_FIELD:
            type = PartType::Fraction;
            break;
        case UNUM_DECIMAL_SEPARATOR_FIELD:
            type = PartType::Decimal;
            break;
        case UNUM_GROUPING_SEPARATOR_FIELD:
            type = PartType::Group;
            break;
        case UNUM_SIGN_FIELD:
            type = signPartType(text, span.start);
            break;
        default:
            continue;
        }
        for (int32_t i = span.start; i < span.limit && i < text.length(); ++i)
        {
            types[static_cast<std::size_t>(i)] = type;
        }
    }

    std::vector<NumberPart> parts;
    int32_t run_start = 0;
    for (int32_t i = 1; i <= text.length(); ++i)
    {
        bool boundary = i == text.length() ||
                        types[static_cast<std::size_t>(i)] != types[static_cast<std::size_t>(run_start)] ||
                        types[static_cast<std::size_t>(i)] == PartType::Group;
        if (!boundary)
            continue;

        NumberPart part{ types[static_cast<std::size_t>(run_start)], {} };
        text.tempSubStringBetween(run_start, i).toUTF8String(part.value);
        parts.push_back(std::move(part));
        run_start = i;
    }

    if (numfmt::Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(numfmt::Diagnostics::kLogInstance) << "IcuLocaleProvider: " << tag << " produced " << parts.size()
                                                       << " parts";
    }
    return parts;
}

} // namespace l10n
