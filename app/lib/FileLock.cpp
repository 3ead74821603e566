#include "FileLock.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

#if defined(_WIN32)
#include <windows.h>
#elif defined(__unix__) || defined(__APPLE__)
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#define RELOCATOR_HAS_FLOCK 1
#endif

namespace {
constexpr auto kLockRetryInterval = std::chrono::milliseconds(10);

void lock_log_error(const std::string& message)
{
    if (auto logger = Logger::get_logger("journal_logger")) {
        logger->error("{}", message);
    }
}
}


FileLock::FileLock(std::filesystem::path lock_path)
    : lock_path_(std::move(lock_path))
{
}


FileLock::~FileLock()
{
    release();
}


bool FileLock::supported()
{
#if defined(_WIN32) || defined(RELOCATOR_HAS_FLOCK)
    return true;
#else
    return false;
#endif
}


#if defined(_WIN32)

bool FileLock::acquire(std::chrono::milliseconds timeout)
{
    if (locked_) {
        return true;
    }
    HANDLE handle = CreateFileW(lock_path_.c_str(), GENERIC_READ | GENERIC_WRITE,
                                FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr, OPEN_ALWAYS,
                                FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        lock_log_error("Cannot open lock file " + Utils::path_to_utf8(lock_path_) +
                       ": error " + std::to_string(GetLastError()));
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        OVERLAPPED overlapped{};
        if (LockFileEx(handle, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY, 0,
                       MAXDWORD, MAXDWORD, &overlapped)) {
            handle_ = handle;
            locked_ = true;
            return true;
        }
        const DWORD error = GetLastError();
        if (error != ERROR_LOCK_VIOLATION || std::chrono::steady_clock::now() >= deadline) {
            CloseHandle(handle);
            lock_log_error("Failed to lock " + Utils::path_to_utf8(lock_path_) +
                           ": error " + std::to_string(error));
            return false;
        }
        std::this_thread::sleep_for(kLockRetryInterval);
    }
}


void FileLock::release()
{
    if (!locked_) {
        return;
    }
    HANDLE handle = static_cast<HANDLE>(handle_);
    OVERLAPPED overlapped{};
    UnlockFileEx(handle, 0, MAXDWORD, MAXDWORD, &overlapped);
    CloseHandle(handle);
    handle_ = nullptr;
    locked_ = false;
}

#elif defined(RELOCATOR_HAS_FLOCK)

bool FileLock::acquire(std::chrono::milliseconds timeout)
{
    if (locked_) {
        return true;
    }
    const std::string lock_path = Utils::path_to_utf8(lock_path_);
    const int fd = ::open(lock_path.c_str(), O_CREAT | O_CLOEXEC | O_RDWR, 0600);
    if (fd < 0) {
        lock_log_error("Cannot open lock file " + lock_path + ": " + std::strerror(errno));
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            fd_ = fd;
            locked_ = true;
            return true;
        }
        const int error = errno;
        if ((error != EWOULDBLOCK && error != EINTR) || std::chrono::steady_clock::now() >= deadline) {
            ::close(fd);
            lock_log_error("Failed to lock " + lock_path + ": " +
                           (error == EWOULDBLOCK ? std::string("timed out") : std::string(std::strerror(error))));
            return false;
        }
        std::this_thread::sleep_for(kLockRetryInterval);
    }
}


void FileLock::release()
{
    if (!locked_) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
    locked_ = false;
}

#else

bool FileLock::acquire(std::chrono::milliseconds)
{
    degraded_ = true;
    locked_ = true;
    if (auto logger = Logger::get_logger("journal_logger")) {
        logger->warn("No file locking primitive on this platform; writing {} without a lock (degraded safety)",
                     Utils::path_to_utf8(lock_path_));
    }
    return true;
}


void FileLock::release()
{
    locked_ = false;
}

#endif
