#include "archive_command.hpp"

#include <gist/archive.hpp>

namespace gist::cli {

void ArchiveCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Gist ID")
        ->required()
        ->type_name("<id>");
}

int ArchiveCommand::execute(CommandContext& ctx) {
    auto archive = create_archive(id_, *ctx.vcs, *ctx.runner, fs::current_path(), ctx.logger);
    if (!archive.ok()) {
        return report_error(archive.error());
    }

    std::cout << archive.value().filename().string() << "\n";
    return GIST_EXIT_SUCCESS;
}

}  // namespace gist::cli
