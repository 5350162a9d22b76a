#include "gate.hpp"

#include "ipc/signals.hpp"
#include "logging/logger.hpp"
#include "model/types.hpp"
#include "roles/workload.hpp"
#include "semaphore/acquire_loop.hpp"
#include "semaphore/release_guard.hpp"
#include "semaphore/semaphore_store.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>
#include <unistd.h>

namespace {
std::atomic<bool> stopRequested(false);
std::atomic<int> stopSignal(0);

// Dispositions replaced by installHandlers, put back by restoreHandlers.
struct SavedDisposition {
    int signum;
    bool installed;
    struct sigaction previous;
};

SavedDisposition savedDispositions[] = {
    {SIGINT, false, {}},
    {SIGTERM, false, {}},
    {SIGHUP, false, {}},
};
} // namespace

void Gate::requestStop(int signum) {
    stopSignal.store(signum);
    stopRequested.store(true);
}

void Gate::installHandlers() {
    for (auto& saved : savedDispositions) {
        saved.installed = false;
        // Inherited SIG_IGN (nohup, background jobs) stays in force for us and the workload.
        if (Signals::isIgnored(saved.signum)) {
            logEvent(Role::Gate, "signal " + std::to_string(saved.signum) + " ignored on entry, left ignored");
            continue;
        }
        saved.installed = Signals::setHandler(saved.signum, &Gate::requestStop, &saved.previous);
    }
}

void Gate::restoreHandlers() {
    for (auto& saved : savedDispositions) {
        if (saved.installed) {
            Signals::restore(saved.signum, saved.previous);
            saved.installed = false;
        }
    }
}

void Gate::onAcquired(std::function<void()> callback) {
    onAcquired_ = std::move(callback);
}

bool Gate::prepareStorage(const Config& config) {
    namespace fs = std::filesystem;

    fs::path lockDir = fs::path(config.semaphoreFile).parent_path();
    if (lockDir.empty()) {
        return true;
    }

    // Remember the outermost directory that does not exist yet; that one is ours.
    std::error_code ec;
    fs::path topCreated;
    for (fs::path p = lockDir; !p.empty() && !fs::exists(p, ec); p = p.parent_path()) {
        topCreated = p;
        if (p == p.parent_path()) break;
    }
    if (topCreated.empty()) {
        return true;
    }

    if (!fs::create_directories(lockDir, ec) && ec) {
        std::cerr << "jobgate: cannot create " << lockDir.string() << ": " << ec.message() << std::endl;
        return false;
    }
    logEvent(Role::Gate, "created " + lockDir.string());

    if (config.writeGitignore) {
        fs::path ignore = topCreated / ".gitignore";
        std::ofstream out(ignore);
        if (out) {
            out << "*\n";
        } else {
            logWarning(Role::Gate, "cannot write " + ignore.string());
        }
    }
    return true;
}

int Gate::run(const Config& config, const std::vector<std::string>& command) {
    stopRequested.store(false);
    stopSignal.store(0);

    if (!prepareStorage(config)) {
        return kExitStoreFailure;
    }

    installHandlers();
    ReleaseGuard::installExitHook();

    SemaphoreStore store(config.semaphoreFile);
    ReleaseGuard guard(store);

    AcquireOptions options;
    options.maxConcurrent = config.maxConcurrentJobs;
    options.retryIntervalMs = config.retryIntervalMs;
    options.timeoutMs = config.acquireTimeoutMs;
    options.stopFlag = &stopRequested;

    AcquireLoop loop(store, options);
    AcquireOutcome outcome = loop.run();

    if (outcome != AcquireOutcome::Acquired) {
        // Nothing was incremented; the guard only logs.
        guard.release();
        restoreHandlers();
        switch (outcome) {
            case AcquireOutcome::Cancelled:
                return 0;
            case AcquireOutcome::TimedOut:
                return kExitTimedOut;
            default:
                return kExitStoreFailure;
        }
    }
    guard.markAcquired();
    if (onAcquired_) {
        onAcquired_();
    }

    int rc;
    if (stopRequested.load()) {
        logEvent(Role::Gate, "interrupted before the workload started");
        rc = kExitStoreFailure;
    } else {
        Workload workload(command, &stopRequested, &stopSignal);
        rc = workload.run();
        if (rc < 0) {
            rc = kExitStoreFailure;
        }
    }

    guard.release();

    int signum = stopSignal.load();
    restoreHandlers();
    if (stopRequested.load() && signum != 0) {
        logEvent(Role::Gate, "terminating with signal " + std::to_string(signum));
        std::fflush(nullptr);
        Signals::reraise(signum);
    }
    return rc;
}

int Gate::status(const Config& config) {
    int current = 0;
    if (access(config.semaphoreFile.c_str(), F_OK) == 0) {
        SemaphoreStore store(config.semaphoreFile);
        current = store.count();
        if (current < 0) {
            return kExitStoreFailure;
        }
    }
    std::cout << config.semaphoreFile << ": " << current << "/" << config.maxConcurrentJobs
              << " slots in use" << std::endl;
    return 0;
}

int Gate::releaseOne(const Config& config) {
    if (access(config.semaphoreFile.c_str(), F_OK) != 0) {
        std::cout << config.semaphoreFile << ": no semaphore file, nothing to release" << std::endl;
        return 0;
    }
    SemaphoreStore store(config.semaphoreFile);
    if (!store.release()) {
        return kExitStoreFailure;
    }
    int current = store.count();
    if (current < 0) {
        return kExitStoreFailure;
    }
    std::cout << config.semaphoreFile << ": " << current << "/" << config.maxConcurrentJobs
              << " slots in use" << std::endl;
    return 0;
}
