#include "semaphore/release_guard.hpp"

#include "logging/logger.hpp"
#include "semaphore/semaphore_store.hpp"
#include "util/error.hpp"

#include <cstdlib>

namespace {
// Head of the list of live guards, newest first.
ReleaseGuard* g_liveGuards = nullptr;
bool g_exitHookInstalled = false;
} // namespace

ReleaseGuard::ReleaseGuard(SemaphoreStore& store)
    : store_(store),
      state_(ProcessState::NotAcquired),
      released_(false),
      notAcquiredLogged_(false),
      prev_(nullptr),
      next_(g_liveGuards) {
    if (next_ != nullptr) {
        next_->prev_ = this;
    }
    g_liveGuards = this;
}

ReleaseGuard::~ReleaseGuard() {
    release();
    if (prev_ != nullptr) {
        prev_->next_ = next_;
    } else if (g_liveGuards == this) {
        g_liveGuards = next_;
    }
    if (next_ != nullptr) {
        next_->prev_ = prev_;
    }
}

void ReleaseGuard::markAcquired() {
    state_.store(ProcessState::Acquired);
}

bool ReleaseGuard::release() {
    if (state_.load() != ProcessState::Acquired) {
        if (!notAcquiredLogged_) {
            logEvent(Role::Guard, "lock not acquired, no decrement required");
            notAcquiredLogged_ = true;
        }
        return false;
    }
    // Latch first: a second caller (destructor, atexit) must never decrement again.
    if (released_.exchange(true)) {
        return false;
    }
    logEvent(Role::Guard, "decrementing the semaphore");
    if (!store_.release()) {
        logWarning(Role::Guard, "could not return slot to " + store_.path() +
                                "; run 'jobgate release' to recover it");
        return false;
    }
    return true;
}

void ReleaseGuard::installExitHook() {
    if (g_exitHookInstalled) {
        return;
    }
    if (std::atexit(&ReleaseGuard::releaseLiveGuards) != 0) {
        logErrno("atexit registration failed");
        return;
    }
    g_exitHookInstalled = true;
}

void ReleaseGuard::releaseLiveGuards() {
    for (ReleaseGuard* guard = g_liveGuards; guard != nullptr; guard = guard->next_) {
        guard->release();
    }
}
