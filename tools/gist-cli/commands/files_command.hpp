#pragma once

#include "command.hpp"

namespace gist::cli {

/**
 * Print the names of a gist's files.
 */
class FilesCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "files"; }
    std::string description() const override {
        return "List the files in a gist";
    }

private:
    GistId id_;
};

}  // namespace gist::cli
