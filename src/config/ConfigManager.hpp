#pragma once

#include <toml++/toml.h>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

// Receives the table found at a registered path, or an empty table when the
// document does not contain it.
using SectionLoader = std::function<void(const toml::table& section)>;

/**
 * @brief Owns the parsed config.toml and routes each section to its reader.
 *
 * Readers register a dotted path ("oracle.classifier") together with the keys
 * they understand. Keys nobody claims are logged as warnings. A missing file
 * or a parse error leaves every reader on its defaults.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");

    bool registerTable(const std::string& path, SectionLoader loader, std::vector<std::string> keys);

    // Reads path(). Returns false only on a parse error.
    bool load();
    bool loadFromString(std::string_view document);

    const toml::table& root() const { return document_; }
    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    struct Section
    {
        std::string path;
        SectionLoader loader;
        std::vector<std::string> keys;
    };

    template<typename Parse>
    bool adopt(Parse&& parse);
    void notifyReaders() const;

    std::string config_path_;
    std::string last_error_;
    std::vector<Section> sections_;
    toml::table document_;
};
