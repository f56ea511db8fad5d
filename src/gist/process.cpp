#include <gist/process.hpp>
#include <gist/util/strings.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gist {

namespace {

// Ignore terminal-generated signals in the parent for the lifetime of a child.
class ScopedSignalIgnore {
public:
    ScopedSignalIgnore() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGINT, &ignore, &old_int_);
        sigaction(SIGQUIT, &ignore, &old_quit_);
    }

    ~ScopedSignalIgnore() {
        sigaction(SIGINT, &old_int_, nullptr);
        sigaction(SIGQUIT, &old_quit_, nullptr);
    }

    ScopedSignalIgnore(const ScopedSignalIgnore&) = delete;
    ScopedSignalIgnore& operator=(const ScopedSignalIgnore&) = delete;

private:
    struct sigaction old_int_ {};
    struct sigaction old_quit_ {};
};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

}  // namespace

Result<int> PosixProcessRunner::run(const std::vector<std::string>& argv,
                                    const fs::path& cwd) {
    auto result = spawn(argv, cwd, false);
    if (!result.ok()) {
        return result.error();
    }
    return result.value().exit_code;
}

Result<ProcessOutput> PosixProcessRunner::capture(const std::vector<std::string>& argv,
                                                  const fs::path& cwd) {
    return spawn(argv, cwd, true);
}

Result<ProcessOutput> PosixProcessRunner::spawn(const std::vector<std::string>& argv,
                                                const fs::path& cwd,
                                                bool capture_stdout) {
    if (argv.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Empty command");
    }

    if (logger_) {
        logger_->debug("exec: " + join_args(argv) +
                       (cwd.empty() ? "" : " (in " + cwd.string() + ")"));
    }

    // The child reports a failed chdir/exec through this pipe; a successful
    // exec closes it (O_CLOEXEC) and the parent reads EOF.
    int status_pipe[2] = {-1, -1};
    if (pipe2(status_pipe, O_CLOEXEC) == -1) {
        return Error(ErrorCode::IO_ERROR,
                     std::string("pipe failed: ") + std::strerror(errno));
    }

    int out_pipe[2] = {-1, -1};
    if (capture_stdout && pipe2(out_pipe, O_CLOEXEC) == -1) {
        int err = errno;
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
        return Error(ErrorCode::IO_ERROR,
                     std::string("pipe failed: ") + std::strerror(err));
    }

    // Build argv before forking; only async-signal-safe calls in the child.
    std::vector<char*> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);
    std::string cwd_str = cwd.string();

    ScopedSignalIgnore ignore_signals;

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return Error(ErrorCode::IO_ERROR,
                     std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process
        signal(SIGINT, SIG_DFL);
        signal(SIGQUIT, SIG_DFL);

        if (capture_stdout) {
            dup2(out_pipe[1], STDOUT_FILENO);
        }

        if (!cwd_str.empty() && chdir(cwd_str.c_str()) == -1) {
            int err = errno;
            ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        execvp(child_argv[0], child_argv.data());

        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close_fd(status_pipe[1]);
    close_fd(out_pipe[1]);

    ProcessOutput output;
    if (capture_stdout) {
        char buf[4096];
        while (true) {
            ssize_t n = read(out_pipe[0], buf, sizeof(buf));
            if (n > 0) {
                output.out.append(buf, static_cast<size_t>(n));
            } else if (n == 0) {
                break;
            } else if (errno != EINTR) {
                break;
            }
        }
        close_fd(out_pipe[0]);
    }

    int child_errno = 0;
    ssize_t got;
    do {
        got = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (got == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        return Error(ErrorCode::IO_ERROR,
                     "Cannot execute '" + argv[0] + "': " + std::strerror(child_errno));
    }

    if (waited == -1) {
        return Error(ErrorCode::IO_ERROR,
                     std::string("waitpid failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    }

    if (logger_ && output.exit_code != 0) {
        logger_->debug(argv[0] + " exited with status " + std::to_string(output.exit_code));
    }

    return output;
}

}  // namespace gist
