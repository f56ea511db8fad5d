#include <gist/edit_session.hpp>
#include <gist/interrupt.hpp>
#include <gist/util/strings.hpp>
#include <gist/working_directory.hpp>

#include <algorithm>
#include <cctype>

namespace gist {

const char* edit_state_name(EditState state) {
    switch (state) {
        case EditState::INITIAL: return "INITIAL";
        case EditState::CLONED: return "CLONED";
        case EditState::EDITOR_RUNNING: return "EDITOR_RUNNING";
        case EditState::CHANGES_DETECTED: return "CHANGES_DETECTED";
        case EditState::NO_CHANGES: return "NO_CHANGES";
        case EditState::COMMITTED: return "COMMITTED";
        case EditState::PUSHED: return "PUSHED";
        case EditState::DISCARDED: return "DISCARDED";
        default: return "UNKNOWN";
    }
}

bool StreamConfirmer::confirm(const std::string& question) {
    out_ << question << " [y/N] " << std::flush;

    std::string response;
    if (!std::getline(in_, response)) {
        out_ << "\n";
        return false;
    }

    response = trim(response);
    std::transform(response.begin(), response.end(), response.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return response == "y" || response == "yes";
}

EditSession::EditSession(VcsTransport& vcs, EditorLauncher& launcher,
                         Confirmer& confirmer, Logger* logger)
    : vcs_(vcs)
    , launcher_(launcher)
    , confirmer_(confirmer)
    , logger_(logger) {}

void EditSession::transition(EditState next) {
    if (logger_) {
        logger_->debug(std::string("edit: ") + edit_state_name(state_) + " -> " +
                       edit_state_name(next));
    }
    state_ = next;
}

Result<EditState> EditSession::run(const GistId& id, const EditorSpec& editor) {
    auto valid = validate_gist_id(id);
    if (!valid.ok()) {
        return valid.error();
    }

    // Declared before the scratch directory so handlers stay installed
    // until it has been removed.
    InterruptGuard guard;

    auto workdir = WorkingDirectory::create(scratch_parent_);
    if (!workdir.ok()) {
        return workdir.error();
    }
    WorkingDirectory& scratch = workdir.value();
    fs::path repo = scratch.path() / id;

    auto cloned = vcs_.clone(id, repo);
    if (!cloned.ok()) {
        return cloned.error();
    }
    if (guard.interrupted()) {
        return guard.error();
    }
    transition(EditState::CLONED);

    transition(EditState::EDITOR_RUNNING);
    auto status = launcher_.launch(editor, repo, repo);
    if (!status.ok()) {
        return status.error();
    }
    if (guard.interrupted()) {
        return guard.error();
    }
    if (status.value() != 0 && logger_) {
        logger_->warning("Editor exited with status " + std::to_string(status.value()));
    }

    auto changed = vcs_.has_changes(repo);
    if (!changed.ok()) {
        return changed.error();
    }
    if (!changed.value()) {
        transition(EditState::NO_CHANGES);
        return state_;
    }
    transition(EditState::CHANGES_DETECTED);

    bool confirmed = confirmer_.confirm("Commit changes to " + id + "?");
    if (guard.interrupted()) {
        return guard.error();
    }
    if (!confirmed) {
        transition(EditState::DISCARDED);
        return state_;
    }

    auto committed = vcs_.commit(repo, "");
    if (!committed.ok()) {
        return committed.error();
    }
    transition(EditState::COMMITTED);

    auto pushed = vcs_.push(repo);
    if (!pushed.ok()) {
        preserved_ = scratch.release();
        return Error(pushed.error().code(),
                     pushed.error().to_string() + "; changes kept in " + repo.string());
    }
    transition(EditState::PUSHED);
    return state_;
}

}  // namespace gist
