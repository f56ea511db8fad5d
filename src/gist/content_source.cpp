#include <gist/content_source.hpp>
#include <gist/interrupt.hpp>
#include <gist/util/file_io.hpp>
#include <gist/working_directory.hpp>

#include <cerrno>
#include <cstring>
#include <type_traits>
#include <unistd.h>

namespace gist {

Result<std::string> FdInputReader::read_all() {
    std::string content;
    char buffer[8192];

    while (true) {
        ssize_t n = ::read(fd_, buffer, sizeof(buffer));
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Error(ErrorCode::IO_ERROR,
                         std::string("Failed to read standard input: ") + std::strerror(errno));
        }
        content.append(buffer, static_cast<size_t>(n));
    }
    return content;
}

ContentSource select_content_source(bool stdin_is_tty,
                                    const std::vector<std::string>& paths) {
    if (!stdin_is_tty) {
        return PipedInput{};
    }
    if (!paths.empty()) {
        FileListInput files;
        files.paths.assign(paths.begin(), paths.end());
        return files;
    }
    return InteractiveInput{};
}

Result<ContentPlan> plan_from_input(InputReader& input) {
    auto content = input.read_all();
    if (!content.ok()) {
        return content.error();
    }

    ContentPlan plan;
    plan[DEFAULT_FILENAME] = std::move(content.value());
    return plan;
}

Result<ContentPlan> plan_from_files(const std::vector<fs::path>& paths) {
    ContentPlan plan;
    for (const auto& path : paths) {
        auto content = read_file(path);
        if (!content.has_value()) {
            return Error(ErrorCode::INPUT_ERROR, "Cannot read file: " + path.string());
        }
        plan[path.filename().string()] = std::move(*content);
    }
    return plan;
}

Result<ContentPlan> plan_from_editor(const EditorSpec& editor,
                                     EditorLauncher& launcher,
                                     Logger* logger,
                                     const fs::path& scratch_parent) {
    InterruptGuard guard;

    auto scratch = WorkingDirectory::create(scratch_parent);
    if (!scratch.ok()) {
        return scratch.error();
    }

    fs::path file = scratch.value().path() / DEFAULT_FILENAME;
    if (!write_file(file, "")) {
        return Error(ErrorCode::IO_ERROR, "Cannot create scratch file: " + file.string());
    }

    auto status = launcher.launch(editor, file, scratch.value().path());
    if (!status.ok()) {
        return status.error();
    }
    if (guard.interrupted()) {
        return guard.error();
    }
    if (status.value() != 0 && logger) {
        logger->warning("Editor exited with status " + std::to_string(status.value()));
    }

    auto content = read_file(file);
    if (!content.has_value()) {
        return Error(ErrorCode::IO_ERROR, "Cannot read scratch file: " + file.string());
    }

    ContentPlan plan;
    plan[DEFAULT_FILENAME] = std::move(*content);
    return plan;
}

Result<ContentPlan> resolve_content(const ContentSource& source,
                                    const ContentInputs& inputs) {
    return std::visit(
        [&](const auto& mode) -> Result<ContentPlan> {
            using T = std::decay_t<decltype(mode)>;

            if constexpr (std::is_same_v<T, PipedInput>) {
                if (!inputs.input) {
                    return Error(ErrorCode::INTERNAL_ERROR, "No input reader");
                }
                if (inputs.logger) inputs.logger->debug("create: reading content from stdin");
                return plan_from_input(*inputs.input);
            } else if constexpr (std::is_same_v<T, FileListInput>) {
                if (inputs.logger) {
                    inputs.logger->debug("create: reading " + std::to_string(mode.paths.size()) +
                                         " file(s)");
                }
                return plan_from_files(mode.paths);
            } else {
                if (!inputs.launcher || !inputs.editor) {
                    return Error(ErrorCode::INTERNAL_ERROR, "No editor launcher");
                }
                auto editor = inputs.editor();
                if (!editor.ok()) {
                    return editor.error();
                }
                if (inputs.logger) inputs.logger->debug("create: launching " + editor.value());
                return plan_from_editor(editor.value(), *inputs.launcher, inputs.logger,
                                        inputs.scratch_parent);
            }
        },
        source);
}

}  // namespace gist
