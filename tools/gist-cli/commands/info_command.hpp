#pragma once

#include "command.hpp"

namespace gist::cli {

/**
 * Print a gist's metadata as returned by the API.
 */
class InfoCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "info"; }
    std::string description() const override {
        return "Show the full JSON description of a gist";
    }

private:
    GistId id_;
};

}  // namespace gist::cli
