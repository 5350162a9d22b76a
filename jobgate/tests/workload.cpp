#include <catch2/catch.hpp>

#include "roles/workload.hpp"
#include "semaphore/acquire_loop.hpp"
#include "test_helpers.hpp"

#include <sys/wait.h>
#include <atomic>
#include <csignal>
#include <thread>

CATCH_TEST_CASE("ExitCodeIsPassedThrough", "[workload]") {
    TempDir dir;
    Workload ok({"true"});
    CATCH_REQUIRE(ok.run() == 0);

    Workload failing({"sh", "-c", "exit 3"});
    CATCH_REQUIRE(failing.run() == 3);
    CATCH_REQUIRE(failing.pid() == -1);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("CommandNotFound", "[workload]") {
    TempDir dir;
    Workload missing({"jobgate-no-such-command-xyz"});
    CATCH_REQUIRE(missing.run() == 127);
}

CATCH_TEST_CASE("CommandNotExecutable", "[workload]") {
    TempDir dir;
    std::string script = dir.file("plain.txt");
    writeFile(script, "echo hi\n");
    Workload notExec({script});
    CATCH_REQUIRE(notExec.run() == 126);
}

CATCH_TEST_CASE("KilledBySignalMapsTo128PlusN", "[workload]") {
    TempDir dir;
    Workload killed({"sh", "-c", "kill -KILL $$"});
    CATCH_REQUIRE(killed.run() == 128 + SIGKILL);
}

CATCH_TEST_CASE("DecodeWaitStatus", "[workload]") {
    // Linux encoding: exit code in bits 8-15, terminating signal in the low 7 bits.
    CATCH_REQUIRE(Workload::decodeWaitStatus(0) == 0);
    CATCH_REQUIRE(Workload::decodeWaitStatus(5 << 8) == 5);
    CATCH_REQUIRE(Workload::decodeWaitStatus(SIGTERM) == 128 + SIGTERM);
}

CATCH_TEST_CASE("PendingTermIsForwardedToChild", "[workload]") {
    TempDir dir;
    std::atomic<bool> stop(true);
    std::atomic<int> signum(SIGTERM);
    Workload sleeper({"sleep", "5"}, &stop, &signum);

    long long start = monotonicMs();
    CATCH_REQUIRE(sleeper.run() == 128 + SIGTERM);
    CATCH_REQUIRE(monotonicMs() - start < 4000);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("StopRaisedMidWaitIsForwarded", "[workload]") {
    // No signal reaches this process, so nothing interrupts the wait: the flag alone must be noticed.
    TempDir dir;
    std::atomic<bool> stop(false);
    std::atomic<int> signum(0);
    Workload sleeper({"sleep", "5"}, &stop, &signum);

    std::thread stopper([&stop, &signum]() {
        sleepMs(150);
        signum.store(SIGTERM);
        stop.store(true);
    });

    long long start = monotonicMs();
    int rc = sleeper.run();
    long long elapsed = monotonicMs() - start;
    stopper.join();

    CATCH_REQUIRE(rc == 128 + SIGTERM);
    CATCH_REQUIRE(elapsed < 4000);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("InterruptIsNotForwarded", "[workload]") {
    TempDir dir;
    std::atomic<bool> stop(true);
    std::atomic<int> signum(SIGINT);
    Workload shortJob({"sh", "-c", "sleep 0.2; exit 4"}, &stop, &signum);
    CATCH_REQUIRE(shortJob.run() == 4);
}

CATCH_TEST_CASE("DescribeJoinsArguments", "[workload]") {
    Workload w({"sh", "-c", "exit 1"});
    CATCH_REQUIRE(w.describe() == "sh -c exit 1");
}
