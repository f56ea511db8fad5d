#include "content_command.hpp"

#include <gist/formatter.hpp>

namespace gist::cli {

void ContentCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Gist ID")
        ->required()
        ->type_name("<id>");
}

int ContentCommand::execute(CommandContext& ctx) {
    auto api = open_api(ctx);
    if (!api) return GIST_EXIT_FAILURE;

    auto files = api->content(id_);
    if (!files.ok()) {
        return report_error(files.error());
    }

    std::cout << format_content(files.value());
    return GIST_EXIT_SUCCESS;
}

}  // namespace gist::cli
