#pragma once

#include "CurrencyDefinition.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace currency
{

/// CurrencyRegistry maps currency codes to their display definition.
/// Populated once (built-in table and/or a JSON dataset), then shared
/// read-only; all const members are safe to call concurrently.
class CurrencyRegistry
{
public:
    CurrencyRegistry();
    ~CurrencyRegistry();

    CurrencyRegistry(CurrencyRegistry&&) noexcept;
    CurrencyRegistry& operator=(CurrencyRegistry&&) noexcept;
    CurrencyRegistry(const CurrencyRegistry&) = delete;
    CurrencyRegistry& operator=(const CurrencyRegistry&) = delete;

    /// Registry pre-filled with the built-in currency table.
    static CurrencyRegistry withBuiltinCurrencies();

    /// Process-wide registry holding the built-in table. Never mutated.
    static const CurrencyRegistry& builtin();

    /// Load definitions from a JSON array file and add them to the registry
    /// (existing codes are overwritten). Returns false when the file cannot
    /// be opened or is not a JSON array; malformed entries are skipped.
    /// Failures are logged to plog and queued on utils::ErrorReporter.
    bool loadFromFile(const std::string& path);

    /// Same as loadFromFile for an in-memory document. Returns the number of
    /// definitions added, or -1 when the document is not a JSON array.
    long loadFromJson(const std::string& document);

    /// Add or replace one definition. Entries with an empty code are ignored.
    void add(CurrencyDefinition definition);

    /// Lookup by exact code. nullptr when absent.
    [[nodiscard]] const CurrencyDefinition* find(std::string_view code) const;

    /// Lookup that never fails: an unknown code yields a Leading definition
    /// using the code itself as the symbol ("¤" for an empty code).
    [[nodiscard]] CurrencyDefinition resolve(std::string_view code) const;

    /// All registered codes, sorted.
    [[nodiscard]] std::vector<std::string> codes() const;

    [[nodiscard]] std::size_t count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Symbol used when a currency has neither a definition nor a code.
inline constexpr std::string_view kGenericCurrencySign = "\xC2\xA4"; // ¤

} // namespace currency
