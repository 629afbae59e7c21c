#pragma once

#include <filesystem>
#include <utility>

/**
 * RAII holder of an acquired advisory lock.
 * Releasing (explicitly or on destruction) unlocks and removes the lock file.
 */
class LockGuard
{
public:
    LockGuard(int fd, std::filesystem::path path);
    ~LockGuard();

    LockGuard(const LockGuard &) = delete;
    LockGuard &operator=(const LockGuard &) = delete;

    LockGuard(LockGuard &&other) noexcept;
    LockGuard &operator=(LockGuard &&other) noexcept;

    /**
     * Release early. Safe to call more than once.
     */
    void release() noexcept;

    bool held() const { return fd_ >= 0; }
    const std::filesystem::path &path() const { return path_; }

private:
    int fd_ = -1;
    std::filesystem::path path_;
};

/**
 * Filesystem-based exclusive lock, effective against other instances of this tool.
 * Uses flock(2), so a second acquire() from the same process also conflicts.
 */
class AdvisoryLock
{
public:
    explicit AdvisoryLock(std::filesystem::path path) : path_(std::move(path)) {}

    /**
     * Try to take the lock without blocking.
     *
     * @return Guard holding the lock for its lifetime
     * @throws LockConflictError if another holder exists
     * @throws TransferError (Storage) if the lock file cannot be created
     */
    LockGuard acquire() const;

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};
