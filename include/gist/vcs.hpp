#pragma once

#include <gist/process.hpp>
#include <gist/result.hpp>
#include <gist/types.hpp>
#include <gist/util/logger.hpp>

#include <string>

namespace gist {

/**
 * Reject ids that cannot be used as a single path component or command
 * operand: empty, ".", "..", containing '/' or starting with '-'.
 * @return INVALID_ARGUMENT naming the id
 */
Result<void> validate_gist_id(const GistId& id);

/**
 * Version-control operations on a gist's backing repository.
 */
class VcsTransport {
public:
    virtual ~VcsTransport() = default;

    /**
     * Clone the gist into dest (which must not exist yet or be empty).
     */
    virtual Result<void> clone(const GistId& id, const fs::path& dest) = 0;

    /**
     * Whether the working tree differs from HEAD (edits, additions,
     * deletions).
     */
    virtual Result<bool> has_changes(const fs::path& repo) = 0;

    /**
     * Stage everything and commit.
     */
    virtual Result<void> commit(const fs::path& repo, const std::string& message) = 0;

    /**
     * Push the current branch back to the gist.
     */
    virtual Result<void> push(const fs::path& repo) = 0;
};

/**
 * VcsTransport backed by the git command-line client.
 */
class GitTransport : public VcsTransport {
public:
    explicit GitTransport(ProcessRunner& runner,
                          std::string remote_host = "git@gist.github.com",
                          Logger* logger = nullptr);

    Result<void> clone(const GistId& id, const fs::path& dest) override;
    Result<bool> has_changes(const fs::path& repo) override;
    Result<void> commit(const fs::path& repo, const std::string& message) override;
    Result<void> push(const fs::path& repo) override;

    /**
     * SSH remote for a gist, e.g. "git@gist.github.com:<id>.git".
     */
    std::string remote_url(const GistId& id) const;

private:
    ProcessRunner& runner_;
    std::string remote_host_;
    Logger* logger_;

    Result<void> git(const std::vector<std::string>& args, const fs::path& repo,
                     ErrorCode failure_code, const std::string& what);
};

}  // namespace gist
