#pragma once

#include <atomic>

#include "model/types.hpp"

class SemaphoreStore;

/**
 * @brief Knobs for the polling loop.
 */
struct AcquireOptions {
    /** Upper bound on simultaneous holders. */
    int maxConcurrent{1};
    /** Fixed delay between failed attempts; no backoff. */
    int retryIntervalMs{5000};
    /** Give up after this long; 0 waits forever. */
    int timeoutMs{0};
    /** Checked before every attempt and while sleeping; nullptr disables cancellation. */
    const std::atomic<bool>* stopFlag{nullptr};
};

/**
 * @brief Polls SemaphoreStore::tryAcquire at a fixed interval until a slot is free.
 *
 * The file lock is only held inside a single tryAcquire call, never across the sleep,
 * so waiters never block each other's attempts. There is no ordering among waiters:
 * whoever gets the lock first after a slot frees up takes it.
 */
class AcquireLoop {
public:
    AcquireLoop(SemaphoreStore& store, const AcquireOptions& options);

    /**
     * @brief Run until Acquired, or until the timeout/stop flag/an OS error ends it.
     * @return Acquired, TimedOut, Cancelled or Failed.
     */
    AcquireOutcome run();

    /** @brief Number of tryAcquire calls made by the last run(). */
    int attempts() const { return attempts_; }

private:
    bool stopRequested() const;

    /**
     * @brief Sleep for up to ms, waking early on the stop flag.
     * @return false if the stop flag ended the sleep.
     */
    bool sleepFor(long long ms);

    SemaphoreStore& store_;
    AcquireOptions options_;
    int attempts_;
};

/** @brief CLOCK_MONOTONIC in milliseconds (0 if the clock is unavailable). */
long long monotonicMs();
