#include <gist/interrupt.hpp>

#include <cstring>
#include <string>

namespace gist {

namespace {

volatile std::sig_atomic_t g_caught_signal = 0;
int g_guard_depth = 0;

extern "C" void record_signal(int sig) {
    g_caught_signal = sig;
}

}  // namespace

InterruptGuard::InterruptGuard() {
    if (g_guard_depth++ == 0) {
        g_caught_signal = 0;
    }

    struct sigaction action {};
    action.sa_handler = record_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    sigaction(SIGINT, &action, &old_int_);
    sigaction(SIGQUIT, &action, &old_quit_);
    sigaction(SIGTERM, &action, &old_term_);
    sigaction(SIGHUP, &action, &old_hup_);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGQUIT, &old_quit_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
    sigaction(SIGHUP, &old_hup_, nullptr);
    --g_guard_depth;
}

bool InterruptGuard::interrupted() const {
    return g_caught_signal != 0;
}

int InterruptGuard::signal_number() const {
    return static_cast<int>(g_caught_signal);
}

Error InterruptGuard::error() const {
    int sig = signal_number();
    const char* name = strsignal(sig);
    return Error(ErrorCode::INTERRUPTED,
                 std::string("Interrupted by ") + (name ? name : "signal") +
                 " (" + std::to_string(sig) + ")");
}

}  // namespace gist
