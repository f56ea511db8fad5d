#pragma once

#include "command.hpp"

namespace gist::cli {

/**
 * Fork someone's gist into the authenticated account.
 */
class ForkCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "fork"; }
    std::string description() const override {
        return "Fork a gist";
    }

private:
    GistId id_;
};

}  // namespace gist::cli
