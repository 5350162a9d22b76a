#pragma once

#include <signal.h>
#include <functional>

/**
 * @brief Helpers for setting simple C++ signal handlers.
 */
namespace Signals {
    using Handler = std::function<void(int)>;

    /**
     * @brief Install a handler for a given signal.
     *
     * Installed without SA_RESTART so blocking calls (sleep, waitpid) return EINTR
     * and the caller gets a chance to look at its stop flag.
     * @param signum signal number (e.g., SIGTERM).
     * @param handler function/lambda taking the signal number.
     * @param previous if non-null, receives the disposition that was replaced.
     * @return true on success, false on failure.
     */
    bool setHandler(int signum, Handler handler, struct sigaction* previous = nullptr);

    /**
     * @brief Whether the signal is currently ignored (e.g. SIGHUP under nohup).
     * @param signum signal number.
     */
    bool isIgnored(int signum);

    /**
     * @brief Put back a disposition saved by setHandler and forget the stored handler.
     * @param signum signal number.
     * @param previous disposition returned through setHandler's previous argument.
     */
    void restore(int signum, const struct sigaction& previous);

    /**
     * @brief Put back the default disposition (SIG_DFL) and forget any stored handler.
     * @param signum signal number.
     */
    void restoreDefault(int signum);

    /**
     * @brief Restore the default disposition and deliver the signal to ourselves.
     *
     * Used to make process termination reflect an interrupt that was first caught
     * so cleanup could run. Returns only if the default action does not terminate.
     * @param signum signal number to re-raise.
     */
    void reraise(int signum);
}
