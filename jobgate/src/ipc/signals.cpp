#include "ipc/signals.hpp"

#include "util/error.hpp"

#include <map>

namespace {
std::map<int, Signals::Handler>& handlerMap() {
    static std::map<int, Signals::Handler> handlers;
    return handlers;
}

void dispatch(int signum) {
    auto it = handlerMap().find(signum);
    if (it != handlerMap().end() && it->second) {
        it->second(signum);
    }
}
} // namespace

namespace Signals {

bool setHandler(int signum, Handler handler, struct sigaction* previous) {
    // Install a std::function-backed handler via sigaction.
    struct sigaction sa {};
    sa.sa_handler = dispatch;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    handlerMap()[signum] = std::move(handler);
    if (sigaction(signum, &sa, previous) == -1) {
        handlerMap().erase(signum);
        logErrno("sigaction failed");
        return false;
    }
    return true;
}

bool isIgnored(int signum) {
    struct sigaction current {};
    if (sigaction(signum, nullptr, &current) == -1) {
        logErrno("sigaction query failed");
        return false;
    }
    return (current.sa_flags & SA_SIGINFO) == 0 && current.sa_handler == SIG_IGN;
}

void restore(int signum, const struct sigaction& previous) {
    if (sigaction(signum, &previous, nullptr) == -1) {
        logErrno("sigaction restore failed");
    }
    handlerMap().erase(signum);
}

void restoreDefault(int signum) {
    struct sigaction sa {};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (sigaction(signum, &sa, nullptr) == -1) {
        logErrno("sigaction SIG_DFL failed");
    }
    handlerMap().erase(signum);
}

void reraise(int signum) {
    restoreDefault(signum);

    // The signal may be blocked if we are called from inside a handler chain.
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, signum);
    sigprocmask(SIG_UNBLOCK, &set, nullptr);

    if (raise(signum) != 0) {
        logErrno("raise failed");
    }
}

} // namespace Signals
