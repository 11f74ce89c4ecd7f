#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace
{

bool contains(const std::vector<std::string>& keys, const std::string& key)
{
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

} // namespace

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

bool ConfigManager::registerTable(const std::string& path, SectionLoader loader, std::vector<std::string> keys)
{
    for (const auto& section : sections_)
    {
        if (section.path != path)
            continue;
        const auto clash = std::find_if(keys.begin(), keys.end(),
                                        [&](const std::string& key) { return contains(section.keys, key); });
        if (clash != keys.end())
        {
            last_error_ = "key '" + *clash + "' in [" + path + "] is already claimed";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    sections_.push_back({ path, std::move(loader), std::move(keys) });
    return true;
}

template<typename Parse>
bool ConfigManager::adopt(Parse&& parse)
{
    last_error_.clear();
    bool ok = true;
    try
    {
        document_ = parse();
    }
    catch (const toml::parse_error& pe)
    {
        ok = false;
        document_ = toml::table{};
        last_error_ = "config parse error: " + std::string(pe.description());

        const auto line = pe.source().begin.line;
        std::string details = line > 0 ? "line " + std::to_string(line) + ": " : std::string();
        details += std::string(pe.description()) + "\nFile: " + config_path_;

        PLOG_WARNING << last_error_;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.", details);
    }
    notifyReaders();
    return ok;
}

bool ConfigManager::load()
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path_, ec))
    {
        last_error_.clear();
        document_ = toml::table{};
        PLOG_INFO << "No config at " << config_path_ << "; using defaults";
        notifyReaders();
        return true;
    }

    const bool ok = adopt([this] { return toml::parse_file(config_path_); });
    if (ok)
        PLOG_INFO << "Loaded config from " << config_path_;
    return ok;
}

bool ConfigManager::loadFromString(std::string_view document)
{
    return adopt([document] { return toml::parse(document); });
}

void ConfigManager::notifyReaders() const
{
    static const toml::table kEmpty;
    for (const auto& section : sections_)
    {
        const toml::table* table = document_.at_path(section.path).as_table();
        if (!table)
        {
            section.loader(kEmpty);
            continue;
        }

        for (const auto& [key, node] : *table)
        {
            // Sub-tables are routed to their own readers.
            const std::string name(key.str());
            if (!node.is_table() && !contains(section.keys, name))
                PLOG_WARNING << "Unknown config key '" << name << "' in [" << section.path << "]";
        }
        section.loader(*table);
    }
}
