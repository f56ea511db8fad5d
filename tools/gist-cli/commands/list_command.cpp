#include "list_command.hpp"

#include <gist/formatter.hpp>

namespace gist::cli {

void ListCommand::setup(CLI::App& /* app */) {
    // No options for list command
}

int ListCommand::execute(CommandContext& ctx) {
    auto api = open_api(ctx);
    if (!api) return GIST_EXIT_FAILURE;

    auto gists = api->list();
    if (!gists.ok()) {
        return report_error(gists.error());
    }

    std::cout << format_list(gists.value(), terminal_width());
    return GIST_EXIT_SUCCESS;
}

}  // namespace gist::cli
