#pragma once

#include "command.hpp"

namespace gist::cli {

/**
 * Clone a gist and package it as <id>.tar.gz in the current directory.
 */
class ArchiveCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "archive"; }
    std::string description() const override {
        return "Download a gist as <id>.tar.gz";
    }

private:
    GistId id_;
};

}  // namespace gist::cli
