#include "Application.hpp"
#include "config/SettingsStore.hpp"
#include "currency/CurrencyRegistry.hpp"
#include "l10n/IcuLocaleProvider.hpp"
#include "numfmt/Diagnostics.hpp"
#include "numfmt/FormatOptions.hpp"
#include "numfmt/FormatPresets.hpp"
#include "numfmt/NumberTextService.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <cmath>
#include <cstring>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

#include <plog/Log.h>

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        printUsage();
        return 2;
    }

    if (!initialize())
        return 1;

    int status = dispatch();

    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
        std::cerr << utils::ErrorReporter::FormatReport(report) << '\n';
    return status;
}

bool Application::initialize()
{
    if (!initializeLogging())
        return false;

    initializeConfig();

    const auto& settings = config_->settings();
    numfmt::Diagnostics::SetVerbose(settings.verbose_diagnostics);

    registry_ = std::make_unique<currency::CurrencyRegistry>(currency::CurrencyRegistry::withBuiltinCurrencies());
    if (!settings.currency_file.empty())
    {
        // Built-in table stays usable when the dataset is broken
        registry_->loadFromFile(settings.currency_file);
    }

    provider_ = std::make_unique<l10n::IcuLocaleProvider>(settings.default_locale);
    service_ = std::make_unique<numfmt::NumberTextService>(*provider_, *registry_, settings.export_policy);

    PLOG_INFO << "numtx ready: locale=" << settings.number_format.locale
              << " currency=" << settings.number_format.currency << " currencies=" << registry_->count()
              << " export_policy=" << numfmt::toString(settings.export_policy);
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    utils::LogManager::RegisterLogger<0>({ .name = "main",
                                           .filepath = "logs/numtx.log",
                                           .append_override = std::nullopt,
                                           .level_override = std::nullopt,
                                           .max_file_size = 5 * 1024 * 1024,
                                           .backup_count = 3,
                                           .add_console_appender = false });

    utils::LogManager::RegisterLogger<numfmt::Diagnostics::kLogInstance>({ .name = "diagnostics",
                                                                           .filepath = "logs/numfmt.log",
                                                                           .append_override = std::nullopt,
                                                                           .level_override = plog::debug,
                                                                           .max_file_size = 5 * 1024 * 1024,
                                                                           .backup_count = 3,
                                                                           .add_console_appender = false });
    return true;
}

void Application::initializeConfig()
{
    config_ = std::make_unique<config::SettingsStore>();
    if (!config_->load())
    {
        PLOG_WARNING << "config.toml unusable, running with defaults: " << config_->lastError();
    }
}

bool Application::parseCommandLineArgs()
{
    if (argc_ < 2)
        return false;

    invocation_.command = argv_[1];
    for (int i = 2; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        auto next = [&]() -> const char* { return i + 1 < argc_ ? argv_[++i] : nullptr; };

        if (std::strcmp(arg, "--locale") == 0)
        {
            const char* value = next();
            if (value == nullptr)
                return false;
            invocation_.locale = value;
        }
        else if (std::strcmp(arg, "--currency") == 0)
        {
            const char* value = next();
            if (value == nullptr)
                return false;
            invocation_.currency = value;
            invocation_.currency_style = true;
        }
        else if (std::strcmp(arg, "--currency-style") == 0)
        {
            invocation_.currency_style = true;
        }
        else if (std::strcmp(arg, "--digits") == 0)
        {
            const char* value = next();
            std::optional<std::pair<unsigned, unsigned>> digits;
            if (value != nullptr)
                digits = numfmt::parseFractionDigits(value);
            if (!digits)
                return false;
            invocation_.min_digits = digits->first;
            invocation_.max_digits = digits->second;
        }
        else if (std::strcmp(arg, "--no-grouping") == 0)
        {
            invocation_.grouping = false;
        }
        else if (std::strcmp(arg, "--private") == 0)
        {
            invocation_.force_private = true;
        }
        else if (std::strcmp(arg, "--show") == 0)
        {
            invocation_.ignore_privacy = true;
        }
        else
        {
            invocation_.operands.emplace_back(arg);
        }
    }
    return true;
}

int Application::dispatch()
{
    try
    {
        if (invocation_.command == "format")
            return runFormat();
        if (invocation_.command == "parse")
            return runParse();
        if (invocation_.command == "export")
            return runExport();
        if (invocation_.command == "mask")
            return runMask();
        if (invocation_.command == "presets")
            return runPresets();
    }
    catch (const std::invalid_argument& ex)
    {
        // Only FormatOptions throws, for inconsistent --digits bounds
        std::cerr << "numtx: " << ex.what() << '\n';
        return 2;
    }

    printUsage();
    return 2;
}

int Application::runFormat()
{
    if (invocation_.operands.size() != 1)
    {
        printUsage();
        return 2;
    }

    config::NumberFormatSettings settings = config_->numberFormat();
    if (!invocation_.locale.empty())
        settings.locale = invocation_.locale;
    if (invocation_.force_private)
        settings.privacy_mode = true;

    // Input is canonical text, so it goes through the export path, not the locale parser
    const double value = service_->parse(service_->normalizeForExport(invocation_.operands.front()), "en-US");
    if (std::isnan(value))
    {
        std::cerr << "numtx: '" << invocation_.operands.front() << "' is not a number\n";
        return 1;
    }

    const auto options = invocation_.currency_style
                             ? numfmt::FormatOptions::currency(invocation_.currency, invocation_.min_digits,
                                                               invocation_.max_digits, invocation_.grouping)
                             : numfmt::FormatOptions::decimal(invocation_.min_digits, invocation_.max_digits,
                                                              invocation_.grouping);

    std::cout << service_->formatForDisplay(value, settings, options, { .ignore_privacy = invocation_.ignore_privacy })
              << '\n';
    return 0;
}

int Application::runParse()
{
    if (invocation_.operands.size() != 1)
    {
        printUsage();
        return 2;
    }

    config::NumberFormatSettings settings = config_->numberFormat();
    if (!invocation_.locale.empty())
        settings.locale = invocation_.locale;

    const double value = service_->parseForDisplay(invocation_.operands.front(), settings);
    std::cout << service_->normalizeForExport(value) << '\n';
    return std::isnan(value) ? 1 : 0;
}

int Application::runExport()
{
    if (invocation_.operands.empty())
    {
        printUsage();
        return 2;
    }

    for (const auto& text : invocation_.operands)
        std::cout << service_->normalizeForExport(text) << '\n';
    return 0;
}

int Application::runMask()
{
    if (invocation_.operands.size() != 1)
    {
        printUsage();
        return 2;
    }

    const std::string locale = invocation_.locale.empty() ? config_->numberFormat().locale : invocation_.locale;
    const double value = service_->parse(service_->normalizeForExport(invocation_.operands.front()), "en-US");

    std::string code = invocation_.currency;
    if (invocation_.currency_style && code.empty())
        code = config_->numberFormat().currency;

    const auto options = invocation_.currency_style
                             ? numfmt::FormatOptions::currency(code, invocation_.min_digits, invocation_.max_digits,
                                                               invocation_.grouping)
                             : numfmt::FormatOptions::decimal(invocation_.min_digits, invocation_.max_digits,
                                                              invocation_.grouping);

    std::optional<double> maybe_value;
    if (!std::isnan(value))
        maybe_value = value;

    std::cout << service_->mask(maybe_value, locale, options, invocation_.currency_style) << '\n';
    return 0;
}

int Application::runPresets()
{
    const auto& current = config_->numberFormat().locale;
    for (const auto& preview : numfmt::presetPreviews(service_->formatter()))
    {
        std::cout << (preview.locale == current ? "* " : "  ") << preview.locale << "  " << preview.preview << '\n';
    }
    if (!numfmt::isKnownPreset(current))
        std::cout << "* " << current << "  (custom)\n";
    return 0;
}

void Application::printUsage() const
{
    std::cerr << "usage:\n"
                 "  numtx format <value> [--locale TAG] [--currency CODE | --currency-style]\n"
                 "                       [--digits MIN[:MAX]] [--no-grouping] [--private] [--show]\n"
                 "  numtx parse <text> [--locale TAG]\n"
                 "  numtx export <text>...\n"
                 "  numtx mask <value> [--locale TAG] [--currency CODE | --currency-style] [--digits MIN[:MAX]]\n"
                 "  numtx presets\n";
}

void Application::cleanup()
{
    // The service refers to the provider and the registry
    service_.reset();
    provider_.reset();
    registry_.reset();
    config_.reset();

    if (utils::LogManager::IsInitialized())
        utils::LogManager::Shutdown();
}
