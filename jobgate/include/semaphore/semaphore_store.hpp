#pragma once

#include <string>

#include "model/types.hpp"

class FileLock;

/**
 * @brief The persisted slot counter shared by every participating process.
 *
 * The file holds one decimal integer and nothing else. Every read-modify-write happens
 * while holding an exclusive flock on that same file, and the lock is dropped before
 * the call returns. Missing, empty or garbled content reads as 0.
 */
class SemaphoreStore {
public:
    /**
     * @param path semaphore file; created (0644) on first use if absent. Parent
     *             directories are not created here.
     */
    explicit SemaphoreStore(std::string path);

    /**
     * @brief Take one slot if fewer than maxConcurrent are held.
     * @param maxConcurrent upper bound on simultaneous holders (> 0).
     * @return Acquired after writing counter+1, Busy if the counter is already at or
     *         above the bound (file untouched), Failed on an OS error.
     */
    AcquireResult tryAcquire(int maxConcurrent);

    /**
     * @brief Give back one slot. A counter already at 0 is left alone.
     * @return false only on an OS error.
     */
    bool release();

    /**
     * @brief Current counter value, read under the lock.
     * @return counter, or -1 on an OS error.
     */
    int count();

    const std::string& path() const { return path_; }

    /**
     * @brief Interpret raw file content as a counter.
     *
     * Surrounding whitespace is ignored. Anything that is not a plain non-negative
     * decimal integer fitting in an int yields 0.
     */
    static int parseCounter(const std::string& content);

private:
    bool readCounter(FileLock& lock, int& value);
    bool writeCounter(FileLock& lock, int value);

    std::string path_;
};
