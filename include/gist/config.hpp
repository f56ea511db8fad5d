#pragma once

#include <gist/result.hpp>
#include <gist/types.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gist {

/**
 * Minimal INI reader.
 *
 * Supports [section] headers, "key = value" (or "key: value") pairs and
 * full-line comments starting with '#' or ';'. Keys outside any section
 * are ignored. A key repeated within a section keeps its last value.
 */
class IniFile {
public:
    static IniFile parse(const std::string& text);

    /**
     * Read and parse a file.
     * @return CONFIG_ERROR if the file cannot be read
     */
    static Result<IniFile> load(const fs::path& path);

    std::optional<std::string> get(const std::string& section,
                                   const std::string& key) const;

    bool has_section(const std::string& section) const;

private:
    std::map<std::string, std::map<std::string, std::string>> sections_;
};

/**
 * Environment values that drive configuration discovery.
 */
struct ConfigEnvironment {
    std::optional<std::string> home;
    std::optional<std::string> xdg_config_home;
    std::optional<std::string> xdg_data_home;

    static ConfigEnvironment from_process();
};

/**
 * Candidate configuration files in lookup order:
 * ~/.gist, $XDG_CONFIG_HOME/gist, $XDG_DATA_HOME/gist.
 */
std::vector<fs::path> config_search_paths(const ConfigEnvironment& env);

/**
 * First candidate that exists, if any.
 */
std::optional<fs::path> find_config_file(const std::vector<fs::path>& candidates);

/**
 * Build a Config from a parsed INI file.
 */
Config config_from_ini(const IniFile& ini);

/**
 * Discover and load the configuration.
 *
 * A missing file yields a default Config with no source; an existing but
 * unreadable file is a CONFIG_ERROR.
 */
Result<Config> load_config(const ConfigEnvironment& env);

/**
 * Check that the configuration carries an API token.
 */
Result<void> require_token(const Config& config);

}  // namespace gist
