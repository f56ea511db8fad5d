#pragma once

#include "command.hpp"

namespace gist::cli {

/**
 * Print each file of a gist preceded by its name.
 */
class ContentCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "content"; }
    std::string description() const override {
        return "Print the content of every file in a gist";
    }

private:
    GistId id_;
};

}  // namespace gist::cli
