#pragma once

/** @brief Result of a single lock-protected acquire attempt on the semaphore file. */
enum class AcquireResult {
    Acquired,
    Busy,
    Failed
};

/** @brief Terminal outcome of the acquire loop. */
enum class AcquireOutcome {
    Acquired,
    TimedOut,
    Cancelled,
    Failed
};

/** @brief Whether this process currently owns one unit of the shared counter. */
enum class ProcessState {
    NotAcquired,
    Acquired
};

/** @brief Component tag written in every log line. */
enum class Role {
    Gate,
    Store,
    AcquireLoop,
    Guard,
    Workload
};
