#include "delete_command.hpp"

namespace gist::cli {

void DeleteCommand::setup(CLI::App& app) {
    app.add_option("ids", ids_, "Gist IDs")
        ->required()
        ->type_name("<id>...");
}

int DeleteCommand::execute(CommandContext& ctx) {
    auto api = open_api(ctx);
    if (!api) return GIST_EXIT_FAILURE;

    for (const auto& id : ids_) {
        auto removed = api->remove(id);
        if (!removed.ok()) {
            return report_error(removed.error());
        }
        if (ctx.logger) ctx.logger->info("Deleted gist " + id);
    }
    return GIST_EXIT_SUCCESS;
}

}  // namespace gist::cli
