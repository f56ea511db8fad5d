#pragma once

#include "command.hpp"

namespace gist::cli {

/**
 * git clone a gist into ./<name> (default ./<id>).
 */
class CloneCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "clone"; }
    std::string description() const override {
        return "Clone a gist";
    }

private:
    GistId id_;
    std::string dir_name_;
};

}  // namespace gist::cli
