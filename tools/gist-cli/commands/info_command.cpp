#include "info_command.hpp"

namespace gist::cli {

void InfoCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Gist ID")
        ->required()
        ->type_name("<id>");
}

int InfoCommand::execute(CommandContext& ctx) {
    auto api = open_api(ctx);
    if (!api) return GIST_EXIT_FAILURE;

    auto info = api->info(id_);
    if (!info.ok()) {
        return report_error(info.error());
    }

    std::cout << info.value() << "\n";
    return GIST_EXIT_SUCCESS;
}

}  // namespace gist::cli
