#include "clone_command.hpp"

namespace gist::cli {

void CloneCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Gist ID")
        ->required()
        ->type_name("<id>");

    app.add_option("name", dir_name_, "Directory to clone into (default: the ID)")
        ->type_name("<name>");
}

int CloneCommand::execute(CommandContext& ctx) {
    fs::path dest = dir_name_.empty() ? fs::path(id_) : fs::path(dir_name_);

    auto cloned = ctx.vcs->clone(id_, dest);
    if (!cloned.ok()) {
        return report_error(cloned.error());
    }
    return GIST_EXIT_SUCCESS;
}

}  // namespace gist::cli
