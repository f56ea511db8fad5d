#pragma once

#include <gist/config.hpp>
#include <gist/editor_launcher.hpp>
#include <gist/editor_resolver.hpp>
#include <gist/gist_api.hpp>
#include <gist/process.hpp>
#include <gist/util/logger.hpp>
#include <gist/vcs.hpp>
#include <CLI/CLI.hpp>

#include "exit_codes.hpp"

#include <iostream>
#include <memory>
#include <string>

namespace gist::cli {

/**
 * Context passed to command execution.
 * Built once in main(); the configuration is never modified afterwards.
 */
struct CommandContext {
    const Config* config = nullptr;
    Logger* logger = nullptr;
    ProcessRunner* runner = nullptr;
    VcsTransport* vcs = nullptr;
    EditorLauncher* launcher = nullptr;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    /**
     * Get the command name (e.g., "list", "edit").
     */
    virtual std::string name() const = 0;

    /**
     * Get a brief description for help text.
     */
    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Print "Error: <message>" to stderr.
 * @return GIST_EXIT_FAILURE
 */
inline int report_error(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    return GIST_EXIT_FAILURE;
}

/**
 * Create the hosting API client.
 * Prints error to stderr when the configuration has no token.
 *
 * @return Client, or nullptr on error
 */
inline std::unique_ptr<GistApi> open_api(const CommandContext& ctx) {
    auto ready = require_token(*ctx.config);
    if (!ready.ok()) {
        report_error(ready.error());
        return nullptr;
    }
    return std::make_unique<GithubGistApi>(*ctx.config, ctx.logger);
}

/**
 * Resolve the editor from /usr/bin/editor, $EDITOR and the config file.
 */
inline Result<EditorSpec> editor_for(const CommandContext& ctx) {
    auto editor = resolve_editor(EditorSources::from_process(*ctx.config));
    if (editor.ok() && ctx.logger) {
        ctx.logger->debug("editor: " + editor.value());
    }
    return editor;
}

}  // namespace gist::cli
