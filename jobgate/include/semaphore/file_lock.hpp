#pragma once

#include <string>

/**
 * @brief Advisory exclusive flock(2) on a file, plus the open descriptor used to read/write it.
 *
 * Use open() once, then lock()/unlock() around the critical section; the destructor
 * drops the lock and closes the descriptor. Only effective between cooperating processes.
 */
class FileLock {
public:
    /** @brief Construct an empty handle (fd = -1). */
    FileLock();
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    /**
     * @brief Open (creating if absent) the file read/write.
     * @param path file to open.
     * @param permissions mode used when the file is created (default 0644).
     * @return true on success, false on failure.
     */
    bool open(const std::string& path, int permissions = 0644);

    /**
     * @brief Block until the exclusive lock is granted. EINTR is retried.
     * @return true on success, false on failure.
     */
    bool lock();

    /**
     * @brief Release the lock if held.
     * @return true on success, false on failure.
     */
    bool unlock();

    /** @brief Unlock and close the descriptor. */
    void close();

    /** @brief Underlying descriptor, or -1 if not open. */
    int fd() const;

private:
    int fd_;
    bool locked_;
};

/**
 * @brief Scope holder: locks in the constructor, unlocks in the destructor.
 */
class FileLockHold {
public:
    explicit FileLockHold(FileLock& lock);
    ~FileLockHold();

    FileLockHold(const FileLockHold&) = delete;
    FileLockHold& operator=(const FileLockHold&) = delete;

    /** @brief Whether the lock was actually granted. */
    bool ok() const { return ok_; }

private:
    FileLock& lock_;
    bool ok_;
};
