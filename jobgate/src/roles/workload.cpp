#include "roles/workload.hpp"

#include "logging/logger.hpp"
#include "util/error.hpp"

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <utility>

namespace {
constexpr int kExitNotExecutable = 126;
constexpr int kExitNotFound = 127;
// A stop raised between two polls is forwarded within one slice.
constexpr useconds_t kWaitSliceUs = 20000;
} // namespace

Workload::Workload(std::vector<std::string> command,
                   const std::atomic<bool>* stopFlag,
                   const std::atomic<int>* stopSignal)
    : command_(std::move(command)), stopFlag_(stopFlag), stopSignal_(stopSignal), pid_(-1) {}

int Workload::run() {
    if (command_.empty()) {
        logWarning(Role::Workload, "empty command");
        return kExitNotFound;
    }

    std::vector<char*> args;
    args.reserve(command_.size() + 1);
    for (auto& arg : command_) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    logEvent(Role::Workload, "starting: " + describe());
    std::fflush(nullptr);

    pid_ = fork();
    if (pid_ == -1) {
        logErrno("Failed to fork workload");
        return -1;
    }
    if (pid_ == 0) {
        // Handlers are reset by exec anyway; the mask is inherited, so clear it.
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        execvp(args[0], args.data());
        int execErrno = errno;
        std::perror(("jobgate: cannot run " + command_[0]).c_str());
        _exit(execErrno == ENOENT ? kExitNotFound : kExitNotExecutable);
    }

    bool forwarded = false;
    int status = 0;
    while (true) {
        forwardStop(forwarded);
        pid_t res = waitpid(pid_, &status, WNOHANG);
        if (res == pid_) {
            break;
        }
        if (res == 0 || (res == -1 && errno == EINTR)) {
            usleep(kWaitSliceUs);
            continue;
        }
        logErrno("waitpid workload failed");
        pid_ = -1;
        return -1;
    }
    pid_ = -1;

    int code = decodeWaitStatus(status);
    logEvent(Role::Workload, "finished with status " + std::to_string(code));
    return code;
}

int Workload::decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string Workload::describe() const {
    std::string out;
    for (const auto& arg : command_) {
        if (!out.empty()) out.push_back(' ');
        out += arg;
    }
    return out;
}

void Workload::forwardStop(bool& forwarded) {
    if (forwarded || stopFlag_ == nullptr || !stopFlag_->load() || pid_ <= 0) {
        return;
    }
    forwarded = true;
    int signum = stopSignal_ != nullptr ? stopSignal_->load() : SIGTERM;
    if (signum != SIGTERM && signum != SIGHUP) {
        return;
    }
    logEvent(Role::Workload, "forwarding signal " + std::to_string(signum) +
                             " to pid " + std::to_string(pid_));
    if (kill(pid_, signum) == -1 && errno != ESRCH) {
        logErrno("kill workload failed");
    }
}
