#include "edit_command.hpp"

#include <gist/edit_session.hpp>

namespace gist::cli {

void EditCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Gist ID")
        ->required()
        ->type_name("<id>");
}

int EditCommand::execute(CommandContext& ctx) {
    // Resolve the editor before anything touches the disk or the network
    auto editor = editor_for(ctx);
    if (!editor.ok()) {
        return report_error(editor.error());
    }

    StreamConfirmer confirmer(std::cin, std::cout);
    EditSession session(*ctx.vcs, *ctx.launcher, confirmer, ctx.logger);

    auto result = session.run(id_, editor.value());
    if (!result.ok()) {
        return report_error(result.error());
    }

    switch (result.value()) {
        case EditState::NO_CHANGES:
            std::cout << "No changes made.\n";
            break;
        case EditState::DISCARDED:
            std::cout << "Changes discarded.\n";
            break;
        case EditState::PUSHED:
            std::cout << "Updated gist " << id_ << "\n";
            break;
        default:
            break;
    }
    return GIST_EXIT_SUCCESS;
}

}  // namespace gist::cli
