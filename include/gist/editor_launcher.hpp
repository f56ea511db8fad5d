#pragma once

#include <gist/process.hpp>
#include <gist/result.hpp>
#include <gist/types.hpp>

namespace gist {

/**
 * Runs the user's editor as a blocking foreground process.
 */
class EditorLauncher {
public:
    virtual ~EditorLauncher() = default;

    /**
     * Open target in the editor and wait for it to exit.
     *
     * @param editor Editor command, split on whitespace
     * @param target File or directory handed to the editor as last argument
     * @param cwd Working directory for the editor (empty: current)
     * @return The editor's exit code
     */
    virtual Result<int> launch(const EditorSpec& editor,
                               const fs::path& target,
                               const fs::path& cwd = {}) = 0;
};

class ProcessEditorLauncher : public EditorLauncher {
public:
    explicit ProcessEditorLauncher(ProcessRunner& runner) : runner_(runner) {}

    Result<int> launch(const EditorSpec& editor,
                       const fs::path& target,
                       const fs::path& cwd = {}) override;

private:
    ProcessRunner& runner_;
};

}  // namespace gist
