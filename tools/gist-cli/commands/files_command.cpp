#include "files_command.hpp"

#include <gist/formatter.hpp>

namespace gist::cli {

void FilesCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Gist ID")
        ->required()
        ->type_name("<id>");
}

int FilesCommand::execute(CommandContext& ctx) {
    auto api = open_api(ctx);
    if (!api) return GIST_EXIT_FAILURE;

    auto names = api->files(id_);
    if (!names.ok()) {
        return report_error(names.error());
    }

    std::cout << format_files(names.value());
    return GIST_EXIT_SUCCESS;
}

}  // namespace gist::cli
