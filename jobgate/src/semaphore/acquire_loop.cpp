#include "semaphore/acquire_loop.hpp"

#include "logging/logger.hpp"
#include "semaphore/semaphore_store.hpp"

#include <algorithm>
#include <ctime>
#include <string>
#include <unistd.h>

namespace {
// Upper bound on how long a stop request can go unnoticed while sleeping.
constexpr long long kStopPollSliceMs = 100;
} // namespace

long long monotonicMs() {
    struct timespec ts {};
    if (clock_gettime(CLOCK_MONOTONIC, &ts) == -1) {
        return 0;
    }
    return static_cast<long long>(ts.tv_sec) * 1000LL + ts.tv_nsec / 1000000LL;
}

AcquireLoop::AcquireLoop(SemaphoreStore& store, const AcquireOptions& options)
    : store_(store), options_(options), attempts_(0) {}

AcquireOutcome AcquireLoop::run() {
    attempts_ = 0;
    long long start = monotonicMs();
    long long deadline = options_.timeoutMs > 0 ? start + options_.timeoutMs : 0;

    while (true) {
        if (stopRequested()) {
            logEvent(Role::AcquireLoop, "stop requested before a slot was taken");
            return AcquireOutcome::Cancelled;
        }

        ++attempts_;
        AcquireResult result = store_.tryAcquire(options_.maxConcurrent);
        if (result == AcquireResult::Acquired) {
            logEvent(Role::AcquireLoop, "acquired after " + std::to_string(attempts_) + " attempt(s)");
            return AcquireOutcome::Acquired;
        }
        if (result == AcquireResult::Failed) {
            return AcquireOutcome::Failed;
        }

        long long waitMs = options_.retryIntervalMs;
        if (deadline != 0) {
            long long left = deadline - monotonicMs();
            if (left <= 0) {
                logWarning(Role::AcquireLoop, "gave up after " + std::to_string(attempts_) +
                                              " attempt(s), timeout " +
                                              std::to_string(options_.timeoutMs) + " ms");
                return AcquireOutcome::TimedOut;
            }
            waitMs = std::min(waitMs, left);
        }

        logEvent(Role::AcquireLoop, "max concurrent jobs running (" +
                                    std::to_string(options_.maxConcurrent) +
                                    "), reattempting in " + std::to_string(waitMs) + " ms");
        if (!sleepFor(waitMs)) {
            logEvent(Role::AcquireLoop, "stop requested while waiting for a slot");
            return AcquireOutcome::Cancelled;
        }
    }
}

bool AcquireLoop::stopRequested() const {
    return options_.stopFlag != nullptr && options_.stopFlag->load();
}

bool AcquireLoop::sleepFor(long long ms) {
    long long wakeAt = monotonicMs() + ms;
    while (true) {
        if (stopRequested()) {
            return false;
        }
        long long left = wakeAt - monotonicMs();
        if (left <= 0) {
            return true;
        }
        // A signal cuts usleep short with EINTR; the loop re-checks the flag either way.
        usleep(static_cast<useconds_t>(std::min(left, kStopPollSliceMs) * 1000));
    }
}
