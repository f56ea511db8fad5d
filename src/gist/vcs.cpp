#include <gist/vcs.hpp>
#include <gist/util/strings.hpp>

namespace gist {

Result<void> validate_gist_id(const GistId& id) {
    if (id.empty() || id == "." || id == ".." ||
        id.find('/') != std::string::npos || id.front() == '-') {
        return Error(ErrorCode::INVALID_ARGUMENT, "Invalid gist ID: '" + id + "'");
    }
    return Ok();
}

GitTransport::GitTransport(ProcessRunner& runner, std::string remote_host, Logger* logger)
    : runner_(runner)
    , remote_host_(std::move(remote_host))
    , logger_(logger) {}

std::string GitTransport::remote_url(const GistId& id) const {
    return remote_host_ + ":" + id + ".git";
}

Result<void> GitTransport::git(const std::vector<std::string>& args, const fs::path& repo,
                               ErrorCode failure_code, const std::string& what) {
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), args.begin(), args.end());

    auto status = runner_.run(argv, repo);
    if (!status.ok()) {
        return status.error();
    }
    if (status.value() != 0) {
        return Error(failure_code,
                     what + " failed (git exited with status " +
                     std::to_string(status.value()) + ")");
    }
    return Ok();
}

Result<void> GitTransport::clone(const GistId& id, const fs::path& dest) {
    auto valid = validate_gist_id(id);
    if (!valid.ok()) {
        return valid;
    }
    if (logger_) logger_->debug("cloning " + remote_url(id) + " into " + dest.string());
    return git({"clone", remote_url(id), dest.string()}, {},
               ErrorCode::REMOTE_ERROR, "Cloning gist " + id);
}

Result<bool> GitTransport::has_changes(const fs::path& repo) {
    auto output = runner_.capture({"git", "status", "--porcelain"}, repo);
    if (!output.ok()) {
        return output.error();
    }
    if (output.value().exit_code != 0) {
        return Error(ErrorCode::IO_ERROR,
                     "git status failed in " + repo.string());
    }
    return !trim(output.value().out).empty();
}

Result<void> GitTransport::commit(const fs::path& repo, const std::string& message) {
    auto added = git({"add", "--all", "."}, repo, ErrorCode::IO_ERROR, "Staging changes");
    if (!added.ok()) {
        return added;
    }
    return git({"commit", "--quiet", "--allow-empty-message", "-m", message}, repo,
               ErrorCode::IO_ERROR, "Committing changes");
}

Result<void> GitTransport::push(const fs::path& repo) {
    return git({"push", "--quiet"}, repo, ErrorCode::REMOTE_ERROR, "Pushing changes");
}

}  // namespace gist
