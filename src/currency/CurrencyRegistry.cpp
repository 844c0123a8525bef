#include "CurrencyRegistry.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace currency
{

namespace
{

struct BuiltinEntry
{
    const char* code;
    const char* symbol;
    const char* name;
    SymbolPosition position;
};

constexpr BuiltinEntry kBuiltinCurrencies[] = {
    { "USD", "$", "US Dollar", SymbolPosition::Leading },
    { "EUR", "\xE2\x82\xAC", "Euro", SymbolPosition::Trailing },
    { "GBP", "\xC2\xA3", "British Pound", SymbolPosition::Leading },
    { "JPY", "\xC2\xA5", "Japanese Yen", SymbolPosition::Leading },
    { "CHF", "CHF", "Swiss Franc", SymbolPosition::Leading },
    { "CAD", "C$", "Canadian Dollar", SymbolPosition::Leading },
    { "AUD", "A$", "Australian Dollar", SymbolPosition::Leading },
    { "CNY", "\xC2\xA5", "Chinese Yuan", SymbolPosition::Leading },
    { "INR", "\xE2\x82\xB9", "Indian Rupee", SymbolPosition::Leading },
    { "BRL", "R$", "Brazilian Real", SymbolPosition::Leading },
    { "MXN", "MX$", "Mexican Peso", SymbolPosition::Leading },
    { "KRW", "\xE2\x82\xA9", "South Korean Won", SymbolPosition::Leading },
    { "TRY", "\xE2\x82\xBA", "Turkish Lira", SymbolPosition::Leading },
    { "ZAR", "R", "South African Rand", SymbolPosition::Leading },
    { "SEK", "kr", "Swedish Krona", SymbolPosition::Trailing },
    { "NOK", "kr", "Norwegian Krone", SymbolPosition::Trailing },
    { "DKK", "kr", "Danish Krone", SymbolPosition::Trailing },
    { "PLN", "z\xC5\x82", "Polish Zloty", SymbolPosition::Trailing },
    { "CZK", "K\xC4\x8D", "Czech Koruna", SymbolPosition::Trailing },
    { "HUF", "Ft", "Hungarian Forint", SymbolPosition::Trailing },
    { "RUB", "\xE2\x82\xBD", "Russian Ruble", SymbolPosition::Trailing },
};

/// "left"/"leading" and "right"/"trailing" are both accepted
std::optional<SymbolPosition> parsePosition(const std::string& text)
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "left" || lower == "leading")
        return SymbolPosition::Leading;
    if (lower == "right" || lower == "trailing")
        return SymbolPosition::Trailing;
    return std::nullopt;
}

/// Helper: Parse one dataset entry; nullopt when required fields are missing
std::optional<CurrencyDefinition> parseDefinition(const json& entry)
{
    if (!entry.is_object())
        return std::nullopt;

    if (!entry.contains("code") || !entry["code"].is_string())
        return std::nullopt;

    CurrencyDefinition def;
    def.code = entry["code"].get<std::string>();
    if (def.code.empty())
        return std::nullopt;

    def.symbol = entry.value("symbol", def.code);
    if (def.symbol.empty())
        def.symbol = def.code;

    if (entry.contains("name") && entry["name"].is_string())
        def.display_name = entry["name"].get<std::string>();
    else
        def.display_name = entry.value("display_name", def.code);

    if (entry.contains("position") && entry["position"].is_string())
    {
        auto position = parsePosition(entry["position"].get<std::string>());
        if (!position)
            return std::nullopt;
        def.position = *position;
    }

    return def;
}

} // anonymous namespace

struct CurrencyRegistry::Impl
{
    // code -> definition
    std::unordered_map<std::string, CurrencyDefinition> by_code_;
};

CurrencyRegistry::CurrencyRegistry()
    : impl_(std::make_unique<Impl>())
{
}

CurrencyRegistry::~CurrencyRegistry() = default;
CurrencyRegistry::CurrencyRegistry(CurrencyRegistry&&) noexcept = default;
CurrencyRegistry& CurrencyRegistry::operator=(CurrencyRegistry&&) noexcept = default;

CurrencyRegistry CurrencyRegistry::withBuiltinCurrencies()
{
    CurrencyRegistry registry;
    for (const auto& entry : kBuiltinCurrencies)
    {
        registry.add({ entry.code, entry.symbol, entry.name, entry.position });
    }
    return registry;
}

const CurrencyRegistry& CurrencyRegistry::builtin()
{
    static const CurrencyRegistry instance = withBuiltinCurrencies();
    return instance;
}

bool CurrencyRegistry::loadFromFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        PLOG_ERROR << "CurrencyRegistry: Failed to open currency data file: " << path;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::CurrencyData,
                                            "Currency list could not be loaded, using built-in currencies", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    long loaded = loadFromJson(buffer.str());
    if (loaded < 0)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::CurrencyData,
                                            "Currency list is not valid JSON, using built-in currencies", path);
        return false;
    }

    PLOG_INFO << "CurrencyRegistry: Loaded " << loaded << " currencies from " << path;
    return true;
}

long CurrencyRegistry::loadFromJson(const std::string& document)
{
    json root;
    try
    {
        root = json::parse(document);
    }
    catch (const json::parse_error& e)
    {
        PLOG_ERROR << "CurrencyRegistry: JSON parse error: " << e.what();
        return -1;
    }

    if (!root.is_array())
    {
        PLOG_ERROR << "CurrencyRegistry: Expected a JSON array of currencies";
        return -1;
    }

    long loaded = 0;
    std::size_t skipped = 0;
    for (const auto& entry : root)
    {
        try
        {
            auto def = parseDefinition(entry);
            if (!def)
            {
                ++skipped;
                continue;
            }
            add(std::move(*def));
            ++loaded;
        }
        catch (const json::exception& e)
        {
            PLOG_WARNING << "CurrencyRegistry: Skipping malformed entry: " << e.what();
            ++skipped;
        }
    }

    if (skipped > 0)
    {
        PLOG_WARNING << "CurrencyRegistry: Skipped " << skipped << " malformed currency entries";
    }
    return loaded;
}

void CurrencyRegistry::add(CurrencyDefinition definition)
{
    if (definition.code.empty())
        return;
    std::string key = definition.code;
    impl_->by_code_[key] = std::move(definition);
}

const CurrencyDefinition* CurrencyRegistry::find(std::string_view code) const
{
    auto it = impl_->by_code_.find(std::string(code));
    if (it == impl_->by_code_.end())
        return nullptr;
    return &it->second;
}

CurrencyDefinition CurrencyRegistry::resolve(std::string_view code) const
{
    if (const auto* def = find(code))
        return *def;

    CurrencyDefinition fallback;
    fallback.code = std::string(code);
    fallback.symbol = code.empty() ? std::string(kGenericCurrencySign) : std::string(code);
    fallback.display_name = fallback.symbol;
    fallback.position = SymbolPosition::Leading;
    return fallback;
}

std::vector<std::string> CurrencyRegistry::codes() const
{
    std::vector<std::string> result;
    result.reserve(impl_->by_code_.size());
    for (const auto& [code, def] : impl_->by_code_)
    {
        result.push_back(code);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::size_t CurrencyRegistry::count() const { return impl_->by_code_.size(); }

} // namespace currency
