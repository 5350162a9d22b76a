#include "semaphore/semaphore_store.hpp"

#include "logging/logger.hpp"
#include "semaphore/file_lock.hpp"
#include "util/error.hpp"

#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <utility>

SemaphoreStore::SemaphoreStore(std::string path) : path_(std::move(path)) {}

AcquireResult SemaphoreStore::tryAcquire(int maxConcurrent) {
    FileLock lock;
    if (!lock.open(path_)) {
        return AcquireResult::Failed;
    }
    FileLockHold hold(lock);
    if (!hold.ok()) {
        return AcquireResult::Failed;
    }

    int current = 0;
    if (!readCounter(lock, current)) {
        return AcquireResult::Failed;
    }
    if (current >= maxConcurrent) {
        return AcquireResult::Busy;
    }
    if (!writeCounter(lock, current + 1)) {
        return AcquireResult::Failed;
    }
    logEvent(Role::Store, "slot taken " + std::to_string(current) + " -> " +
                          std::to_string(current + 1) + " of " + std::to_string(maxConcurrent));
    return AcquireResult::Acquired;
}

bool SemaphoreStore::release() {
    FileLock lock;
    if (!lock.open(path_)) {
        return false;
    }
    FileLockHold hold(lock);
    if (!hold.ok()) {
        return false;
    }

    int current = 0;
    if (!readCounter(lock, current)) {
        return false;
    }
    if (current <= 0) {
        logWarning(Role::Store, "release with counter already at 0, left unchanged");
        return true;
    }
    if (!writeCounter(lock, current - 1)) {
        return false;
    }
    logEvent(Role::Store, "slot returned " + std::to_string(current) + " -> " +
                          std::to_string(current - 1));
    return true;
}

int SemaphoreStore::count() {
    FileLock lock;
    if (!lock.open(path_)) {
        return -1;
    }
    FileLockHold hold(lock);
    if (!hold.ok()) {
        return -1;
    }
    int current = 0;
    if (!readCounter(lock, current)) {
        return -1;
    }
    return current;
}

int SemaphoreStore::parseCounter(const std::string& content) {
    size_t b = content.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return 0;
    }
    size_t e = content.find_last_not_of(" \t\r\n");
    std::string digits = content.substr(b, e - b + 1);
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return 0;
        }
    }
    errno = 0;
    long value = std::strtol(digits.c_str(), nullptr, 10);
    if (errno == ERANGE || value > INT_MAX) {
        return 0;
    }
    return static_cast<int>(value);
}

// Whole-file read from offset 0; only a failing read() is an error, odd content is not.
bool SemaphoreStore::readCounter(FileLock& lock, int& value) {
    std::string content;
    char buf[64];
    off_t offset = 0;
    while (true) {
        ssize_t n = ::pread(lock.fd(), buf, sizeof(buf), offset);
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            logErrno("read semaphore file failed: " + path_);
            return false;
        }
        if (n == 0) {
            break;
        }
        content.append(buf, static_cast<size_t>(n));
        offset += n;
    }
    value = parseCounter(content);
    return true;
}

bool SemaphoreStore::writeCounter(FileLock& lock, int value) {
    if (::ftruncate(lock.fd(), 0) == -1) {
        logErrno("truncate semaphore file failed: " + path_);
        return false;
    }
    std::string text = std::to_string(value) + "\n";
    size_t done = 0;
    while (done < text.size()) {
        ssize_t n = ::pwrite(lock.fd(), text.data() + done, text.size() - done,
                             static_cast<off_t>(done));
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            logErrno("write semaphore file failed: " + path_);
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}
