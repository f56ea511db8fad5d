#include "create_command.hpp"

#include <gist/content_source.hpp>
#include <gist/formatter.hpp>

#include <unistd.h>

namespace gist::cli {

void CreateCommand::setup(CLI::App& app) {
    app.add_option("desc", desc_, "Gist description")
        ->required()
        ->type_name("<desc>");

    app.add_option("files", files_, "Files to upload (default: stdin or editor)")
        ->type_name("<file>...");

    app.add_flag("--public", public_, "Make the gist public");
}

int CreateCommand::execute(CommandContext& ctx) {
    // Token is checked first so a missing configuration fails before the
    // user spends time in the editor
    auto api = open_api(ctx);
    if (!api) return GIST_EXIT_FAILURE;

    ContentSource source = select_content_source(stdin_is_tty(), files_);
    if (std::holds_alternative<PipedInput>(source) && !files_.empty() && ctx.logger) {
        ctx.logger->warning("stdin is not a terminal; reading content from stdin "
                            "and ignoring file arguments");
    }

    FdInputReader reader(STDIN_FILENO);
    ContentInputs inputs;
    inputs.input = &reader;
    inputs.launcher = ctx.launcher;
    inputs.editor = [&ctx]() { return editor_for(ctx); };
    inputs.logger = ctx.logger;

    auto plan = resolve_content(source, inputs);
    if (!plan.ok()) {
        return report_error(plan.error());
    }

    auto created = api->create(desc_, plan.value(), public_);
    if (!created.ok()) {
        return report_error(created.error());
    }

    std::cout << created.value().html_url << "\n";
    return GIST_EXIT_SUCCESS;
}

}  // namespace gist::cli
