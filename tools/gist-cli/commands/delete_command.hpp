#pragma once

#include "command.hpp"

#include <vector>

namespace gist::cli {

/**
 * Delete one or more gists. Stops at the first failure.
 */
class DeleteCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "delete"; }
    std::string description() const override {
        return "Delete gists";
    }

private:
    std::vector<GistId> ids_;
};

}  // namespace gist::cli
