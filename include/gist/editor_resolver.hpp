#pragma once

#include <gist/result.hpp>
#include <gist/types.hpp>

#include <functional>
#include <optional>
#include <string>

namespace gist {

// Debian-style system default editor
constexpr const char* ALTERNATIVES_EDITOR_PATH = "/usr/bin/editor";

// Environment variable naming the user's editor
constexpr const char* EDITOR_ENV_VAR = "EDITOR";

/**
 * Where the resolver looks. Injected so resolution can be tested without
 * touching the real filesystem or environment.
 */
struct EditorSources {
    std::function<bool(const fs::path&)> path_exists;
    std::function<std::optional<std::string>(const std::string&)> env;
    std::optional<std::string> config_editor;

    /**
     * Sources backed by the real filesystem, process environment and the
     * loaded configuration.
     */
    static EditorSources from_process(const Config& config);
};

/**
 * Resolution stages. Each receives the previous stage's result as its
 * fallback and returns either its own value or that fallback, so later
 * stages override earlier ones: config > $EDITOR > /usr/bin/editor.
 */
std::optional<EditorSpec> editor_from_alternatives(const EditorSources& sources,
                                                   std::optional<EditorSpec> fallback);
std::optional<EditorSpec> editor_from_environment(const EditorSources& sources,
                                                  std::optional<EditorSpec> fallback);
std::optional<EditorSpec> editor_from_config(const EditorSources& sources,
                                             std::optional<EditorSpec> fallback);

/**
 * Run the whole chain.
 * @return The editor command, or CONFIG_ERROR when no source yields one
 */
Result<EditorSpec> resolve_editor(const EditorSources& sources);

}  // namespace gist
