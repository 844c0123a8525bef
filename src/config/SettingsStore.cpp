#include "SettingsStore.hpp"
#include "../utils/ErrorReporter.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace config
{

static long long file_mtime_ms(const fs::path& p)
{
    std::error_code ec;
    auto tp = fs::last_write_time(p, ec);
    if (ec)
        return 0;
    // Only compared with itself, so the file clock's own epoch is fine
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

namespace
{

void reportInvalid(const std::string& key, const std::string& details)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Invalid number format setting '" + key + "', using default", details);
}

// Reads a non-empty string; anything else leaves `target` alone
void readString(const toml::table& table, const char* key, std::string& target, bool allow_empty)
{
    const toml::node* node = table.get(key);
    if (node == nullptr)
        return;

    auto value = node->value<std::string>();
    if (!value || (!allow_empty && value->empty()))
    {
        reportInvalid(key, "expected a non-empty string");
        return;
    }
    target = *value;
}

} // namespace

SettingsStore::SettingsStore(std::string config_path)
    : config_path_(std::move(config_path))
{
    last_mtime_ = file_mtime_ms(config_path_);
}

bool SettingsStore::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        root_ = toml::table{};
        settings_ = LibrarySettings{};
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    bool ok = loadFromString(buffer.str());
    last_mtime_ = file_mtime_ms(config_path_);
    return ok;
}

bool SettingsStore::loadFromString(std::string_view document)
{
    last_error_.clear();
    try
    {
        root_ = toml::parse(document, config_path_);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " +
                            std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using default number format.",
                                            error_details + "\nFile: " + config_path_);
        settings_ = LibrarySettings{};
        return false;
    }

    apply(root_);
    return true;
}

bool SettingsStore::reloadIfChanged()
{
    fs::path p(config_path_);
    auto mtime = file_mtime_ms(p);
    if (mtime == 0 || mtime == last_mtime_)
        return false;

    if (load())
    {
        PLOG_INFO << "Number format settings reloaded from " << config_path_;
        return true;
    }
    return false;
}

void SettingsStore::apply(const toml::table& root)
{
    LibrarySettings next;

    if (const toml::table* number_format = root["number_format"].as_table())
    {
        readString(*number_format, "locale", next.number_format.locale, false);
        readString(*number_format, "currency", next.number_format.currency, false);
        readString(*number_format, "default_locale", next.default_locale, true);
        readString(*number_format, "currency_file", next.currency_file, true);

        if (const toml::node* privacy = number_format->get("privacy_mode"))
        {
            if (auto flag = privacy->value<bool>())
                next.number_format.privacy_mode = *flag;
            else
                reportInvalid("privacy_mode", "expected true or false");
        }

        std::string policy_text;
        readString(*number_format, "mixed_separator_policy", policy_text, false);
        if (!policy_text.empty())
        {
            if (auto policy = numfmt::parseMixedSeparatorPolicy(policy_text))
                next.export_policy = *policy;
            else
                reportInvalid("mixed_separator_policy",
                              "'" + policy_text + "' is not one of last_is_decimal, comma_is_grouping");
        }
    }

    if (auto verbose = root["app"]["debug"]["verbose_diagnostics"].value<bool>())
    {
        next.verbose_diagnostics = *verbose;
    }

    settings_ = std::move(next);
}

bool SettingsStore::save()
{
    last_error_.clear();

    toml::table output = root_;
    toml::table* section = output["number_format"].as_table();
    if (section == nullptr)
    {
        output.insert_or_assign("number_format", toml::table{});
        section = output["number_format"].as_table();
    }

    section->insert_or_assign("locale", settings_.number_format.locale);
    section->insert_or_assign("currency", settings_.number_format.currency);
    section->insert_or_assign("privacy_mode", settings_.number_format.privacy_mode);
    section->insert_or_assign("mixed_separator_policy", std::string(numfmt::toString(settings_.export_policy)));
    if (!settings_.default_locale.empty())
        section->insert_or_assign("default_locale", settings_.default_locale);
    if (!settings_.currency_file.empty())
        section->insert_or_assign("currency_file", settings_.currency_file);

    std::string tmp = config_path_ + ".tmp";
    std::ofstream ofs(tmp, std::ios::binary);
    if (!ofs)
    {
        last_error_ = "Failed to open temp file for writing";
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save number format settings",
                                          "Could not create temporary file for writing: " + tmp);
        return false;
    }
    ofs << output;
    ofs.flush();
    ofs.close();

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = std::string("Failed to rename: ") + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save number format settings",
                                          "Could not rename temporary file: " + ec.message());
        return false;
    }

    last_mtime_ = file_mtime_ms(config_path_);
    root_ = std::move(output);
    PLOG_INFO << "Saved number format settings to " << config_path_;
    return true;
}

} // namespace config
