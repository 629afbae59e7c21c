#include "advisory_lock.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <fmt/core.h>

LockGuard::LockGuard(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path))
{
}

LockGuard::~LockGuard()
{
    release();
}

LockGuard::LockGuard(LockGuard &&other) noexcept : fd_(other.fd_), path_(std::move(other.path_))
{
    other.fd_ = -1;
}

LockGuard &LockGuard::operator=(LockGuard &&other) noexcept
{
    if (this != &other)
    {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

void LockGuard::release() noexcept
{
    if (fd_ < 0)
    {
        return;
    }
    // Remove while still holding the lock so a waiter never locks a doomed inode
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

LockGuard AdvisoryLock::acquire() const
{
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            throw TransferError(ErrorKind::Storage,
                                fmt::format("Cannot create lock directory {}: {}", parent.string(), ec.message()));
        }
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        throw TransferError(ErrorKind::Storage,
                            fmt::format("Cannot open lock file {}: {}", path_.string(), std::strerror(errno)));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK)
        {
            throw LockConflictError(path_);
        }
        throw TransferError(ErrorKind::Storage,
                            fmt::format("Cannot lock {}: {}", path_.string(), std::strerror(err)));
    }

    return LockGuard(fd, path_);
}
