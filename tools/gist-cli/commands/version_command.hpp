#pragma once

#include "command.hpp"

namespace gist::cli {

class VersionCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "version"; }
    std::string description() const override {
        return "Print the version";
    }
};

}  // namespace gist::cli
