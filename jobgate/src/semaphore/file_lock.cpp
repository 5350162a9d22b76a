#include "semaphore/file_lock.hpp"

#include "util/error.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <cerrno>

FileLock::FileLock() : fd_(-1), locked_(false) {}

FileLock::~FileLock() {
    close();
}

// Open read/write, create if needed. O_CLOEXEC keeps the descriptor out of the workload.
bool FileLock::open(const std::string& path, int permissions) {
    close();
    do {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, permissions);
    } while (fd_ == -1 && errno == EINTR);
    if (fd_ == -1) {
        logErrno("open semaphore file failed: " + path);
        return false;
    }
    return true;
}

bool FileLock::lock() {
    if (fd_ == -1) {
        logErrno("FileLock::lock called before open");
        return false;
    }
    if (locked_) {
        return true;
    }
    while (::flock(fd_, LOCK_EX) == -1) {
        if (errno == EINTR) {
            continue;
        }
        logErrno("flock LOCK_EX failed");
        return false;
    }
    locked_ = true;
    return true;
}

bool FileLock::unlock() {
    if (fd_ == -1 || !locked_) {
        return true;
    }
    if (::flock(fd_, LOCK_UN) == -1) {
        logErrno("flock LOCK_UN failed");
        return false;
    }
    locked_ = false;
    return true;
}

void FileLock::close() {
    if (fd_ == -1) {
        return;
    }
    unlock();
    // close() also drops the flock, so a failed unlock above is still recovered here.
    ::close(fd_);
    fd_ = -1;
    locked_ = false;
}

int FileLock::fd() const {
    return fd_;
}

FileLockHold::FileLockHold(FileLock& lock) : lock_(lock), ok_(lock.lock()) {}

FileLockHold::~FileLockHold() {
    if (ok_) {
        lock_.unlock();
    }
}
