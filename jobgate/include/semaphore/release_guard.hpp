#pragma once

#include <atomic>

#include "model/types.hpp"

class SemaphoreStore;

/**
 * @brief Gives back a held slot exactly once, whatever way the process leaves.
 *
 * Create it before the acquire loop starts and call markAcquired() right after a
 * successful tryAcquire. release() may then be reached from several places: the normal
 * exit path, the interrupt path, the destructor and the process atexit hook. Only the
 * first call after markAcquired() touches the store. A guard that never acquired
 * never decrements, so an interrupt while still polling leaves the counter alone.
 *
 * Every live guard is on a process-wide list walked by the atexit hook. A guard leaves
 * the list when destroyed, in whatever order guards go away.
 */
class ReleaseGuard {
public:
    explicit ReleaseGuard(SemaphoreStore& store);
    ~ReleaseGuard();

    ReleaseGuard(const ReleaseGuard&) = delete;
    ReleaseGuard& operator=(const ReleaseGuard&) = delete;

    /** @brief Record that this process now owns one unit of the counter. */
    void markAcquired();

    /**
     * @brief Decrement the counter if a slot is held and not yet given back.
     * @return true if this call returned the slot to the store.
     */
    bool release();

    ProcessState state() const { return state_.load(); }

    /** @brief True once a held slot has been given back (or the attempt was made). */
    bool released() const { return released_.load(); }

    /**
     * @brief Register the process-wide atexit hook (once) that releases every live guard.
     *
     * Covers paths that leave through std::exit, where destructors of locals do not run.
     */
    static void installExitHook();

private:
    static void releaseLiveGuards();

    SemaphoreStore& store_;
    std::atomic<ProcessState> state_;
    std::atomic<bool> released_;
    bool notAcquiredLogged_;
    ReleaseGuard* prev_;
    ReleaseGuard* next_;
};
