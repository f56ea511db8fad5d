#include "fork_command.hpp"

namespace gist::cli {

void ForkCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Gist ID")
        ->required()
        ->type_name("<id>");
}

int ForkCommand::execute(CommandContext& ctx) {
    auto api = open_api(ctx);
    if (!api) return GIST_EXIT_FAILURE;

    auto forked = api->fork(id_);
    if (!forked.ok()) {
        return report_error(forked.error());
    }

    std::cout << forked.value().html_url << "\n";
    return GIST_EXIT_SUCCESS;
}

}  // namespace gist::cli
