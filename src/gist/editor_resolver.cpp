#include <gist/editor_resolver.hpp>
#include <gist/util/strings.hpp>

#include <cstdlib>
#include <system_error>

namespace gist {

EditorSources EditorSources::from_process(const Config& config) {
    EditorSources sources;
    sources.path_exists = [](const fs::path& path) {
        std::error_code ec;
        return fs::exists(path, ec);
    };
    sources.env = [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    };
    sources.config_editor = config.editor;
    return sources;
}

std::optional<EditorSpec> editor_from_alternatives(const EditorSources& sources,
                                                   std::optional<EditorSpec> fallback) {
    if (sources.path_exists && sources.path_exists(ALTERNATIVES_EDITOR_PATH)) {
        return EditorSpec(ALTERNATIVES_EDITOR_PATH);
    }
    return fallback;
}

std::optional<EditorSpec> editor_from_environment(const EditorSources& sources,
                                                  std::optional<EditorSpec> fallback) {
    if (!sources.env) return fallback;

    auto value = sources.env(EDITOR_ENV_VAR);
    if (value) {
        std::string editor = trim(*value);
        if (!editor.empty()) return editor;
    }
    return fallback;
}

std::optional<EditorSpec> editor_from_config(const EditorSources& sources,
                                             std::optional<EditorSpec> fallback) {
    if (sources.config_editor) {
        std::string editor = trim(*sources.config_editor);
        if (!editor.empty()) return editor;
    }
    return fallback;
}

Result<EditorSpec> resolve_editor(const EditorSources& sources) {
    std::optional<EditorSpec> editor;
    editor = editor_from_alternatives(sources, editor);
    editor = editor_from_environment(sources, editor);
    editor = editor_from_config(sources, editor);

    if (!editor) {
        return Error(ErrorCode::CONFIG_ERROR,
                     "No editor available: set $EDITOR or 'editor' in the [gist] "
                     "section of the configuration file");
    }
    return *editor;
}

}  // namespace gist
