#pragma once

#include <memory>
#include <string>
#include <vector>

namespace config
{
class SettingsStore;
}

namespace currency
{
class CurrencyRegistry;
}

namespace l10n
{
class ILocaleProvider;
}

namespace numfmt
{
class NumberTextService;
}

/// Command line host for the library:
///
///   numtx format <value> [--locale TAG] [--currency CODE] [--digits MIN[:MAX]]
///                        [--no-grouping] [--private] [--show]
///   numtx parse <text> [--locale TAG]
///   numtx export <text>...
///   numtx mask <value> [--locale TAG] [--currency CODE] [--digits MIN[:MAX]]
///   numtx presets
///
/// Defaults come from config.toml (see config::SettingsStore); flags override
/// them for one invocation.
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    struct Invocation
    {
        std::string command;
        std::vector<std::string> operands;
        std::string locale;
        std::string currency;
        bool currency_style = false;
        unsigned min_digits = 2;
        unsigned max_digits = 2;
        bool grouping = true;
        bool force_private = false;
        bool ignore_privacy = false;
    };

    bool initialize();
    bool initializeLogging();
    void initializeConfig();
    bool parseCommandLineArgs();
    int dispatch();
    void cleanup();

    int runFormat();
    int runParse();
    int runExport();
    int runMask();
    int runPresets();
    void printUsage() const;

    int argc_;
    char** argv_;
    Invocation invocation_;

    std::unique_ptr<config::SettingsStore> config_;
    std::unique_ptr<currency::CurrencyRegistry> registry_;
    std::unique_ptr<l10n::ILocaleProvider> provider_;
    std::unique_ptr<numfmt::NumberTextService> service_;
};
