#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../numfmt/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& config_path, const std::string& log_directory)
{
    if (s_initialized)
        return true;

    ReadConfig(config_path);
    PrepareLogDirectory(log_directory);

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        plog::Severity level = config.level_override.value_or(s_default_level);

        auto* logger = plog::get<InstanceId>();
        if (logger == nullptr)
        {
            logger = &plog::init<InstanceId>(level, file_appender.get());
        }
        else
        {
            logger->setMaxSeverity(level);
            logger->addAppender(file_appender.get());
        }

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger->addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<numfmt::Diagnostics::kLogInstance>(const LoggerConfig&);

void LogManager::Shutdown()
{
    // plog keeps raw pointers to its appenders and cannot detach them, so
    // the appenders stay alive until exit; only the loggers are silenced.
    if (auto* logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    if (auto* logger = plog::get<numfmt::Diagnostics::kLogInstance>())
        logger->setMaxSeverity(plog::none);

    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

void LogManager::PrepareLogDirectory(const std::string& log_directory)
{
    if (log_directory.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(log_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

void LogManager::ReadConfig(const std::string& config_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return;

    try
    {
        auto cfg = toml::parse_file(config_path);
        if (auto debug = cfg["app"]["debug"].as_table())
        {
            if (auto append = (*debug)["append_logs"].value<bool>())
            {
                s_append_logs = *append;
            }

            if (auto level = (*debug)["logging_level"].value<int64_t>())
            {
                int level_int = static_cast<int>(*level);
                if (level_int >= 0 && level_int <= 6)
                {
                    s_default_level = static_cast<plog::Severity>(level_int);
                }
            }
        }
    }
    catch (const toml::parse_error& pe)
    {
        // SettingsStore reports the same file in detail; keep the defaults here
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Logging settings unreadable, using defaults",
                                     std::string(pe.description()));
    }
}

} // namespace utils
