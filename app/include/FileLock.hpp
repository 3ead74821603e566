#ifndef FILE_LOCK_HPP
#define FILE_LOCK_HPP

#include <chrono>
#include <filesystem>

/**
 * @brief Exclusive advisory lock on a lock file, held until release() or destruction.
 *
 * The primitive is chosen at build time: flock() on POSIX, LockFileEx() on
 * Windows. Other targets get an unsynchronized fallback that reports itself
 * through degraded() and logs a warning every time it is used.
 */
class FileLock {
public:
    explicit FileLock(std::filesystem::path lock_path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    /**
     * @brief Try to take the lock until @p timeout expires.
     * @return true when the lock is held (or in degraded mode), false on error or timeout.
     */
    bool acquire(std::chrono::milliseconds timeout);
    void release();

    bool locked() const { return locked_; }
    bool degraded() const { return degraded_; }

    // Whether this build has a real locking primitive.
    static bool supported();

private:
    std::filesystem::path lock_path_;
#if defined(_WIN32)
    void* handle_{nullptr};
#else
    int fd_{-1};
#endif
    bool locked_{false};
    bool degraded_{false};
};

#endif
