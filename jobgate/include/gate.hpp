#pragma once

#include <functional>
#include <string>
#include <vector>

#include "model/config.hpp"

/** @brief Exit status when --timeout expires before a slot frees up (same as timeout(1)). */
constexpr int kExitTimedOut = 124;
/** @brief Exit status when the semaphore file cannot be prepared, opened or written. */
constexpr int kExitStoreFailure = 1;

/**
 * @brief Per-process orchestrator: setup, wait for a slot, run the command, give the slot back.
 */
class Gate {
public:
    Gate() = default;

    /**
     * @brief Entry point for a gated run.
     *
     * SIGINT, SIGTERM and SIGHUP are caught for the duration of the call, except those
     * already ignored on entry, which stay ignored. An interrupt
     * before a slot is taken ends the run cleanly with 0 and leaves the counter alone.
     * An interrupt after that still gives the slot back, then the signal is re-raised
     * with its default action so the process dies the way it was asked to.
     * @param config validated configuration values.
     * @param command workload argv.
     * @return workload status, kExitTimedOut, kExitStoreFailure, or 0 when interrupted
     *         before acquiring.
     */
    int run(const Config& config, const std::vector<std::string>& command);

    /**
     * @brief Print the current counter against the configured maximum to stdout.
     * @return 0 on success, kExitStoreFailure if the file cannot be read.
     */
    int status(const Config& config);

    /**
     * @brief Manually give back one slot (recovery after a holder died from SIGKILL).
     * @return 0 on success, kExitStoreFailure on an OS error.
     */
    int releaseOne(const Config& config);

    /**
     * @brief Create missing parent directories of the semaphore file.
     *
     * When WRITE_GITIGNORE is on, the topmost directory created here gets a
     * .gitignore containing '*', so a lock directory inside a work tree stays untracked.
     * @return false if a directory could not be created.
     */
    static bool prepareStorage(const Config& config);

    /** @brief Signal-path entry: remember the signal and raise the stop flag. */
    static void requestStop(int signum);

    /**
     * @brief Callback run by run() right after a slot is taken, before the workload starts.
     *
     * A stop requested from inside it is seen before anything is launched.
     */
    void onAcquired(std::function<void()> callback);

private:
    /** @brief Catch SIGINT/SIGTERM/SIGHUP unless inherited as ignored; remember what was there. */
    static void installHandlers();
    /** @brief Put back the dispositions replaced by installHandlers. */
    static void restoreHandlers();

    std::function<void()> onAcquired_;
};
