#include "commands/archive_command.hpp"
#include "commands/clone_command.hpp"
#include "commands/content_command.hpp"
#include "commands/create_command.hpp"
#include "commands/delete_command.hpp"
#include "commands/edit_command.hpp"
#include "commands/files_command.hpp"
#include "commands/fork_command.hpp"
#include "commands/info_command.hpp"
#include "commands/list_command.hpp"
#include "commands/version_command.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <vector>

using namespace gist;
using namespace gist::cli;

int main(int argc, char* argv[]) {
    CLI::App app{"gist - manage GitHub gists from the command line"};
    app.require_subcommand(1);

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log debug output to stderr");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<ListCommand>());
    commands.push_back(std::make_unique<EditCommand>());
    commands.push_back(std::make_unique<InfoCommand>());
    commands.push_back(std::make_unique<ForkCommand>());
    commands.push_back(std::make_unique<FilesCommand>());
    commands.push_back(std::make_unique<DeleteCommand>());
    commands.push_back(std::make_unique<ArchiveCommand>());
    commands.push_back(std::make_unique<ContentCommand>());
    commands.push_back(std::make_unique<CreateCommand>());
    commands.push_back(std::make_unique<CloneCommand>());
    commands.push_back(std::make_unique<VersionCommand>());

    std::vector<std::pair<CLI::App*, Command*>> subcommands;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        subcommands.emplace_back(sub, command.get());
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help and version requests exit 0; every usage error exits 1
        return app.exit(e) == 0 ? GIST_EXIT_SUCCESS : GIST_EXIT_FAILURE;
    }

    ConsoleLogger logger;
    logger.set_min_level(verbose ? LogLevel::DEBUG : LogLevel::WARNING);

    auto loaded = load_config(ConfigEnvironment::from_process());
    if (!loaded.ok()) {
        return report_error(loaded.error());
    }
    Config config = std::move(loaded.value());
    config.verbose = verbose;
    if (config.source) {
        logger.debug("config: " + config.source->string());
    }

    PosixProcessRunner runner(&logger);
    GitTransport git(runner, "git@gist.github.com", &logger);
    ProcessEditorLauncher launcher(runner);

    CommandContext ctx;
    ctx.config = &config;
    ctx.logger = &logger;
    ctx.runner = &runner;
    ctx.vcs = &git;
    ctx.launcher = &launcher;

    for (auto& [sub, command] : subcommands) {
        if (sub->parsed()) {
            try {
                return command->execute(ctx);
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return GIST_EXIT_FAILURE;
            }
        }
    }

    return GIST_EXIT_FAILURE;
}
