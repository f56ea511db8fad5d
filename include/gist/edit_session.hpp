#pragma once

#include <gist/editor_launcher.hpp>
#include <gist/result.hpp>
#include <gist/types.hpp>
#include <gist/util/logger.hpp>
#include <gist/vcs.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace gist {

/**
 * Progress of an edit session.
 *
 * INITIAL -> CLONED -> EDITOR_RUNNING -> NO_CHANGES
 *                                     -> CHANGES_DETECTED -> DISCARDED
 *                                                         -> COMMITTED -> PUSHED
 */
enum class EditState {
    INITIAL,
    CLONED,
    EDITOR_RUNNING,
    CHANGES_DETECTED,
    NO_CHANGES,
    COMMITTED,
    PUSHED,
    DISCARDED
};

const char* edit_state_name(EditState state);

/**
 * Yes/no question put to the user.
 */
class Confirmer {
public:
    virtual ~Confirmer() = default;
    virtual bool confirm(const std::string& question) = 0;
};

/**
 * Asks on out and reads one line from in; only "y"/"yes" (any case) agree.
 */
class StreamConfirmer : public Confirmer {
public:
    StreamConfirmer(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    bool confirm(const std::string& question) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

/**
 * Clone -> edit -> detect changes -> confirm -> commit/push for one gist.
 *
 * The gist is cloned into a fresh WorkingDirectory that is removed on every
 * way out of run(), including errors. The single exception is a failed
 * push: the directory is kept so the committed changes are not lost, and
 * preserved_directory() reports where it is.
 *
 * SIGINT, SIGQUIT, SIGTERM and SIGHUP received during run() (including at
 * the confirmation prompt) end it with INTERRUPTED after the current step.
 *
 * Each EditSession handles one run().
 */
class EditSession {
public:
    EditSession(VcsTransport& vcs, EditorLauncher& launcher, Confirmer& confirmer,
                Logger* logger = nullptr);

    /**
     * Parent for the scratch directory (default: system temp directory).
     */
    void set_scratch_parent(fs::path parent) { scratch_parent_ = std::move(parent); }

    /**
     * Run the session.
     * @return The terminal state (NO_CHANGES, DISCARDED or PUSHED), or the
     *         first error encountered
     */
    Result<EditState> run(const GistId& id, const EditorSpec& editor);

    EditState state() const { return state_; }

    const std::optional<fs::path>& preserved_directory() const { return preserved_; }

private:
    VcsTransport& vcs_;
    EditorLauncher& launcher_;
    Confirmer& confirmer_;
    Logger* logger_;
    fs::path scratch_parent_;
    EditState state_ = EditState::INITIAL;
    std::optional<fs::path> preserved_;

    void transition(EditState next);
};

}  // namespace gist
