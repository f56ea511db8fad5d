#pragma once

#include <gist/editor_launcher.hpp>
#include <gist/result.hpp>
#include <gist/types.hpp>
#include <gist/util/logger.hpp>

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace gist {

/**
 * Input modes for `create`. Exactly one applies per invocation:
 * - PipedInput: stdin is not a terminal (wins even when files are given)
 * - FileListInput: stdin is a terminal and files were named
 * - InteractiveInput: stdin is a terminal and no files were named
 */
struct PipedInput {};

struct FileListInput {
    std::vector<fs::path> paths;
};

struct InteractiveInput {};

using ContentSource = std::variant<PipedInput, FileListInput, InteractiveInput>;

/**
 * Source of piped content.
 */
class InputReader {
public:
    virtual ~InputReader() = default;

    /**
     * Read until EOF.
     * @return IO_ERROR if the stream fails
     */
    virtual Result<std::string> read_all() = 0;
};

/**
 * Reads a file descriptor (stdin by default) with read(2).
 *
 * Does not take ownership of fd.
 */
class FdInputReader : public InputReader {
public:
    explicit FdInputReader(int fd = 0) : fd_(fd) {}

    Result<std::string> read_all() override;

private:
    int fd_;
};

/**
 * Pick the input mode from the terminal state and the FILES arguments.
 */
ContentSource select_content_source(bool stdin_is_tty,
                                    const std::vector<std::string>& paths);

/**
 * Piped mode: the whole stream becomes DEFAULT_FILENAME.
 */
Result<ContentPlan> plan_from_input(InputReader& input);

/**
 * File-list mode: each file keyed by its base name.
 *
 * Files sharing a base name overwrite one another; the last path given
 * wins. The first unreadable file aborts with INPUT_ERROR and no plan.
 */
Result<ContentPlan> plan_from_files(const std::vector<fs::path>& paths);

/**
 * Interactive mode: edit an empty DEFAULT_FILENAME in a scratch directory.
 *
 * The editor's exit status does not matter; whatever the file holds when it
 * exits (possibly nothing) becomes the plan. The scratch directory is
 * removed before returning, also when a signal arrives (INTERRUPTED).
 *
 * @param scratch_parent Where to create the scratch directory (empty: temp dir)
 */
Result<ContentPlan> plan_from_editor(const EditorSpec& editor,
                                     EditorLauncher& launcher,
                                     Logger* logger = nullptr,
                                     const fs::path& scratch_parent = {});

/**
 * Everything resolve_content() may need. The editor is looked up only when
 * the interactive mode is selected.
 */
struct ContentInputs {
    InputReader* input = nullptr;
    EditorLauncher* launcher = nullptr;
    std::function<Result<EditorSpec>()> editor;
    Logger* logger = nullptr;
    fs::path scratch_parent;
};

/**
 * Build the plan for the selected mode.
 */
Result<ContentPlan> resolve_content(const ContentSource& source,
                                    const ContentInputs& inputs);

}  // namespace gist
