#pragma once

#include <sys/types.h>
#include <atomic>
#include <string>
#include <vector>

/**
 * @brief The protected command, run exactly once after a slot is held.
 *
 * Its exit status is handed back to the caller untouched; the semaphore layer never
 * looks at it.
 */
class Workload {
public:
    /**
     * @param command argv of the command; command[0] is looked up in PATH.
     * @param stopFlag raised by the caller's signal handlers (may be nullptr).
     * @param stopSignal number of the signal that raised stopFlag (may be nullptr).
     */
    Workload(std::vector<std::string> command,
             const std::atomic<bool>* stopFlag = nullptr,
             const std::atomic<int>* stopSignal = nullptr);

    /**
     * @brief Fork, exec the command and wait for it.
     *
     * The child is polled every few milliseconds, so a stop flag raised at any point
     * during the wait is noticed. A raised stop flag caused by SIGTERM or SIGHUP is forwarded once to
     * the child. SIGINT is not forwarded: a terminal already delivers it to the whole
     * foreground process group.
     * @return shell-style status: exit code, 128+N if killed by signal N, 127 if the
     *         command was not found, 126 if it could not be executed, -1 if fork/wait failed.
     */
    int run();

    /** @brief Pid of the running child, -1 before run() or after it returned. */
    pid_t pid() const { return pid_; }

    /** @brief Map a waitpid status to the shell convention used by run(). */
    static int decodeWaitStatus(int status);

    /** @brief Space-joined argv, for log lines. */
    std::string describe() const;

private:
    void forwardStop(bool& forwarded);

    std::vector<std::string> command_;
    const std::atomic<bool>* stopFlag_;
    const std::atomic<int>* stopSignal_;
    pid_t pid_;
};
