#pragma once

#include "command.hpp"

namespace gist::cli {

/**
 * Edit an existing gist.
 * Clones it, opens the editor on the clone, and pushes on confirmation.
 */
class EditCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "edit"; }
    std::string description() const override {
        return "Edit a gist in your editor and push the changes";
    }

private:
    GistId id_;
};

}  // namespace gist::cli
