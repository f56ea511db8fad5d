#pragma once

#include "command.hpp"

#include <string>
#include <vector>

namespace gist::cli {

/**
 * Create a new gist.
 *
 * Input modes (mutually exclusive):
 * - Piped stdin: the whole input becomes file1.txt (FILES are ignored)
 * - FILES: each file is uploaded under its base name
 * - Neither: the editor opens on an empty file1.txt
 */
class CreateCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "create"; }
    std::string description() const override {
        return "Create a new gist";
    }

private:
    std::string desc_;
    std::vector<std::string> files_;
    bool public_ = false;
};

}  // namespace gist::cli
