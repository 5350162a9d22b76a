#include <catch2/catch.hpp>

#include "ipc/signals.hpp"
#include "semaphore/release_guard.hpp"
#include "semaphore/semaphore_store.hpp"
#include "test_helpers.hpp"
#include "util/error.hpp"

#include <sys/wait.h>
#include <unistd.h>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>

CATCH_TEST_CASE("GuardWithoutSlotNeverDecrements", "[guard]") {
    TempDir dir;
    std::string path = dir.file("semaphore.lock");
    writeFile(path, "1\n");
    SemaphoreStore store(path);
    {
        ReleaseGuard guard(store);
        CATCH_REQUIRE(guard.state() == ProcessState::NotAcquired);
        CATCH_REQUIRE_FALSE(guard.release());
        CATCH_REQUIRE_FALSE(guard.release());
    }
    CATCH_REQUIRE(store.count() == 1);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("GuardReleasesExactlyOnce", "[guard]") {
    TempDir dir;
    std::string path = dir.file("semaphore.lock");
    writeFile(path, "1\n");
    SemaphoreStore store(path);
    {
        ReleaseGuard guard(store);
        CATCH_REQUIRE(store.tryAcquire(3) == AcquireResult::Acquired);
        guard.markAcquired();
        CATCH_REQUIRE(store.count() == 2);

        // Signal path and normal path both reach release().
        CATCH_REQUIRE(guard.release());
        CATCH_REQUIRE_FALSE(guard.release());
        CATCH_REQUIRE(guard.released());
        CATCH_REQUIRE(store.count() == 1);
    }
    // Destructor is the third caller.
    CATCH_REQUIRE(store.count() == 1);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("GuardDestructorReleases", "[guard]") {
    TempDir dir;
    SemaphoreStore store(dir.file("semaphore.lock"));
    {
        ReleaseGuard guard(store);
        CATCH_REQUIRE(store.tryAcquire(1) == AcquireResult::Acquired);
        guard.markAcquired();
        CATCH_REQUIRE(store.count() == 1);
    }
    CATCH_REQUIRE(store.count() == 0);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("EarlyNoOpDoesNotDisarmLaterRelease", "[guard]") {
    TempDir dir;
    SemaphoreStore store(dir.file("semaphore.lock"));
    ReleaseGuard guard(store);
    CATCH_REQUIRE_FALSE(guard.release());

    CATCH_REQUIRE(store.tryAcquire(1) == AcquireResult::Acquired);
    guard.markAcquired();
    CATCH_REQUIRE(guard.release());
    CATCH_REQUIRE(store.count() == 0);
}

// std::exit skips destructors of locals; the atexit hook has to give the slot back.
CATCH_TEST_CASE("ExitHookReleasesOnStdExit", "[guard][processes]") {
    TempDir dir;
    std::string path = dir.file("semaphore.lock");

    // The child runs exit handlers, so nothing buffered in the parent may be flushed twice.
    std::cout.flush();
    std::fflush(nullptr);
    pid_t pid = fork();
    CATCH_REQUIRE(pid != -1);
    if (pid == 0) {
        SemaphoreStore store(path);
        ReleaseGuard guard(store);
        ReleaseGuard::installExitHook();
        if (store.tryAcquire(1) != AcquireResult::Acquired) _exit(2);
        guard.markAcquired();
        die("leaving through std::exit");
    }

    int status = waitChild(pid);
    CATCH_REQUIRE(WIFEXITED(status));
    CATCH_REQUIRE(WEXITSTATUS(status) == EXIT_FAILURE);
    CATCH_REQUIRE(readFile(path) == "0\n");
    SUCCESS_MESSAGE();
}

// Guards destroyed out of construction order must not leave the exit hook pointing at a dead one.
CATCH_TEST_CASE("ExitHookReleasesGuardsAfterOutOfOrderDestruction", "[guard][processes]") {
    TempDir dir;
    std::string pathA = dir.file("a.lock");
    std::string pathB = dir.file("b.lock");
    std::string pathC = dir.file("c.lock");

    std::cout.flush();
    std::fflush(nullptr);
    pid_t pid = fork();
    CATCH_REQUIRE(pid != -1);
    if (pid == 0) {
        SemaphoreStore storeA(pathA);
        SemaphoreStore storeB(pathB);
        SemaphoreStore storeC(pathC);
        ReleaseGuard::installExitHook();

        auto guardA = std::make_unique<ReleaseGuard>(storeA);
        auto guardB = std::make_unique<ReleaseGuard>(storeB);
        auto guardC = std::make_unique<ReleaseGuard>(storeC);
        if (storeA.tryAcquire(1) != AcquireResult::Acquired) _exit(2);
        guardA->markAcquired();
        if (storeB.tryAcquire(1) != AcquireResult::Acquired) _exit(2);
        guardB->markAcquired();
        if (storeC.tryAcquire(1) != AcquireResult::Acquired) _exit(2);
        guardC->markAcquired();

        // Middle guard goes first; A and C stay alive and are left to the exit hook.
        guardB.reset();
        if (storeB.count() != 0) _exit(3);
        guardA.release();
        guardC.release();
        die("leaving with two live guards", 5);
    }

    int status = waitChild(pid);
    CATCH_REQUIRE(WIFEXITED(status));
    CATCH_REQUIRE(WEXITSTATUS(status) == 5);
    CATCH_REQUIRE(readFile(pathA) == "0\n");
    CATCH_REQUIRE(readFile(pathB) == "0\n");
    CATCH_REQUIRE(readFile(pathC) == "0\n");
    SUCCESS_MESSAGE();
}

// A slot is held, then a signal lands before any workload starts: the counter goes back
// to where it was and the process still dies from that signal.
CATCH_TEST_CASE("InterruptAfterAcquireReturnsSlot", "[guard][processes]") {
    TempDir dir;
    std::string path = dir.file("semaphore.lock");

    pid_t pid = fork();
    CATCH_REQUIRE(pid != -1);
    if (pid == 0) {
        static std::atomic<int> caught(0);
        Signals::setHandler(SIGTERM, [](int signum) { caught.store(signum); });

        SemaphoreStore store(path);
        ReleaseGuard guard(store);
        if (store.tryAcquire(1) != AcquireResult::Acquired) _exit(2);
        guard.markAcquired();

        raise(SIGTERM);
        if (caught.load() != SIGTERM) _exit(3);
        guard.release();
        Signals::reraise(SIGTERM);
        _exit(4);
    }

    int status = waitChild(pid);
    CATCH_REQUIRE(WIFSIGNALED(status));
    CATCH_REQUIRE(WTERMSIG(status) == SIGTERM);
    CATCH_REQUIRE(readFile(path) == "0\n");
    SUCCESS_MESSAGE();
}
