#include <gist/editor_launcher.hpp>
#include <gist/util/strings.hpp>

namespace gist {

Result<int> ProcessEditorLauncher::launch(const EditorSpec& editor,
                                          const fs::path& target,
                                          const fs::path& cwd) {
    // Parse editor command (handle "vim" vs "/usr/bin/vim" vs "code --wait")
    std::vector<std::string> args = split_whitespace(editor);
    if (args.empty()) {
        return Error(ErrorCode::CONFIG_ERROR, "Editor command is empty");
    }
    args.push_back(target.string());

    return runner_.run(args, cwd);
}

}  // namespace gist
