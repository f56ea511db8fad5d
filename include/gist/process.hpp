#pragma once

#include <gist/result.hpp>
#include <gist/types.hpp>
#include <gist/util/logger.hpp>

#include <string>
#include <vector>

namespace gist {

/**
 * Exit status and captured stdout of a child process.
 */
struct ProcessOutput {
    int exit_code = -1;
    std::string out;
};

/**
 * Launches child processes.
 *
 * Both calls block until the child exits. An empty cwd means the current
 * directory. Failing to start the program is an IO_ERROR; a non-zero exit
 * status is not an error at this level.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * Run in the foreground with inherited stdin/stdout/stderr.
     * @return The child's exit code
     */
    virtual Result<int> run(const std::vector<std::string>& argv,
                            const fs::path& cwd = {}) = 0;

    /**
     * Run with stdout captured; stdin and stderr are inherited.
     */
    virtual Result<ProcessOutput> capture(const std::vector<std::string>& argv,
                                          const fs::path& cwd = {}) = 0;
};

/**
 * fork/exec implementation (no shell involved).
 *
 * While waiting, the parent ignores SIGINT and SIGQUIT so that an
 * interrupt typed at the terminal reaches only the child, and the caller
 * regains control afterwards to clean up.
 */
class PosixProcessRunner : public ProcessRunner {
public:
    explicit PosixProcessRunner(Logger* logger = nullptr) : logger_(logger) {}

    Result<int> run(const std::vector<std::string>& argv,
                    const fs::path& cwd = {}) override;

    Result<ProcessOutput> capture(const std::vector<std::string>& argv,
                                  const fs::path& cwd = {}) override;

private:
    Logger* logger_;

    Result<ProcessOutput> spawn(const std::vector<std::string>& argv,
                                const fs::path& cwd, bool capture_stdout);
};

}  // namespace gist
