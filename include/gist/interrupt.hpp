#pragma once

#include <gist/result.hpp>

#include <csignal>

namespace gist {

/**
 * Catches SIGINT, SIGQUIT, SIGTERM and SIGHUP for its lifetime.
 *
 * A caught signal only records itself; the owner polls interrupted() between
 * steps and unwinds normally, so scratch directories are still removed.
 * Handlers are installed without SA_RESTART: a blocking read such as a
 * confirmation prompt returns early with EINTR.
 *
 * Guards may nest. The previous dispositions are restored on destruction.
 */
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    bool interrupted() const;

    /** Signal number caught, or 0. */
    int signal_number() const;

    /**
     * INTERRUPTED error naming the signal.
     */
    Error error() const;

private:
    struct sigaction old_int_ {};
    struct sigaction old_quit_ {};
    struct sigaction old_term_ {};
    struct sigaction old_hup_ {};
};

}  // namespace gist
