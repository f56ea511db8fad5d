#include "version_command.hpp"

namespace gist::cli {

void VersionCommand::setup(CLI::App& /* app */) {}

int VersionCommand::execute(CommandContext& /* ctx */) {
    std::cout << "v" << GIST_VERSION << "\n";
    return GIST_EXIT_SUCCESS;
}

}  // namespace gist::cli
