#include <gist/config.hpp>
#include <gist/util/strings.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace gist {

IniFile IniFile::parse(const std::string& text) {
    IniFile ini;
    std::istringstream in(text);
    std::string line;
    std::string section;
    bool in_section = false;

    while (std::getline(in, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            section = trim(trimmed.substr(1, trimmed.size() - 2));
            ini.sections_[section];
            in_section = true;
            continue;
        }

        if (!in_section) continue;

        size_t sep = trimmed.find_first_of("=:");
        if (sep == std::string::npos) continue;

        std::string key = trim(trimmed.substr(0, sep));
        if (key.empty()) continue;
        ini.sections_[section][key] = trim(trimmed.substr(sep + 1));
    }

    return ini;
}

Result<IniFile> IniFile::load(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::CONFIG_ERROR,
                     "Cannot read configuration file: " + path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Error(ErrorCode::CONFIG_ERROR,
                     "Cannot read configuration file: " + path.string());
    }
    return parse(ss.str());
}

std::optional<std::string> IniFile::get(const std::string& section,
                                        const std::string& key) const {
    auto sit = sections_.find(section);
    if (sit == sections_.end()) return std::nullopt;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return std::nullopt;
    return kit->second;
}

bool IniFile::has_section(const std::string& section) const {
    return sections_.count(section) > 0;
}

namespace {

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') return std::string(value);
    return std::nullopt;
}

}  // namespace

ConfigEnvironment ConfigEnvironment::from_process() {
    ConfigEnvironment env;
    env.home = env_value("HOME");
    env.xdg_config_home = env_value("XDG_CONFIG_HOME");
    env.xdg_data_home = env_value("XDG_DATA_HOME");
    return env;
}

std::vector<fs::path> config_search_paths(const ConfigEnvironment& env) {
    std::vector<fs::path> paths;

    if (env.home) {
        paths.push_back(fs::path(*env.home) / ".gist");
    }

    if (env.xdg_config_home) {
        paths.push_back(fs::path(*env.xdg_config_home) / "gist");
    } else if (env.home) {
        paths.push_back(fs::path(*env.home) / ".config" / "gist");
    }

    if (env.xdg_data_home) {
        paths.push_back(fs::path(*env.xdg_data_home) / "gist");
    } else if (env.home) {
        paths.push_back(fs::path(*env.home) / ".local" / "share" / "gist");
    }

    return paths;
}

std::optional<fs::path> find_config_file(const std::vector<fs::path>& candidates) {
    for (const auto& path : candidates) {
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            return path;
        }
    }
    return std::nullopt;
}

Config config_from_ini(const IniFile& ini) {
    Config config;

    if (auto token = ini.get("gist", "token")) {
        config.token = *token;
    }

    if (auto editor = ini.get("gist", "editor")) {
        if (!trim(*editor).empty()) {
            config.editor = trim(*editor);
        }
    }

    if (auto api_url = ini.get("gist", "api_url")) {
        std::string url = trim(*api_url);
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        if (!url.empty()) {
            config.api_url = url;
        }
    }

    return config;
}

Result<Config> load_config(const ConfigEnvironment& env) {
    auto path = find_config_file(config_search_paths(env));
    if (!path) {
        return Config{};
    }

    auto ini = IniFile::load(*path);
    if (!ini.ok()) {
        return ini.error();
    }

    Config config = config_from_ini(ini.value());
    config.source = *path;
    return config;
}

Result<void> require_token(const Config& config) {
    if (!config.source) {
        return Error(ErrorCode::CONFIG_ERROR,
                     "No configuration file found (looked for ~/.gist, "
                     "$XDG_CONFIG_HOME/gist and $XDG_DATA_HOME/gist)");
    }
    if (trim(config.token).empty()) {
        return Error(ErrorCode::CONFIG_ERROR,
                     "No token in [gist] section of " + config.source->string());
    }
    return Ok();
}

}  // namespace gist
