#pragma once

#include "command.hpp"

namespace gist::cli {

/**
 * List the authenticated user's gists, one per line, elided to the
 * terminal width.
 */
class ListCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "list"; }
    std::string description() const override {
        return "List your gists";
    }
};

}  // namespace gist::cli
