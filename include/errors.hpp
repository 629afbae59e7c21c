#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

// aria2 exit status 3: "resource was not found"
inline constexpr long DAEMON_NOT_FOUND_CODE = 3;

/**
 * Error classification used for retry decisions and per-target outcomes.
 */
enum class ErrorKind
{
    TransientNetwork, // Connection reset, timeout, bad HTTP status, short read
    Cancelled,        // Cancellation signal observed
    FileTooSmall,     // Total size below the configured skip size
    LockConflict,     // Another run holds the advisory lock
    DaemonTransport,  // Daemon unreachable or answered garbage
    DaemonProtocol,   // Daemon answered with a JSON-RPC error object
    NotFound,         // Provider or daemon reported the resource missing
    RenewalFailed,    // Fresh link could not be obtained mid-transfer
    Timeout,          // Bounded wait on the daemon elapsed
    Storage,          // Local file could not be opened or written
    Resolve,          // Provider refused to issue a direct link
    Config            // Invalid configuration or input list
};

/**
 * Human-readable name of an error kind (used in logs and reports).
 */
const char *errorKindName(ErrorKind kind);

/**
 * True for the kinds worth another attempt after retry_delay.
 */
bool isRetryable(ErrorKind kind);

/**
 * Base class for every error raised by the download subsystem.
 */
class DownloadError : public std::runtime_error
{
public:
    DownloadError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class TransferError : public DownloadError
{
public:
    using DownloadError::DownloadError;
};

class CancelledError : public DownloadError
{
public:
    explicit CancelledError(const std::string &message = "Download cancelled")
        : DownloadError(ErrorKind::Cancelled, message) {}
};

class FileTooSmallError : public DownloadError
{
public:
    FileTooSmallError(std::uint64_t totalSize, std::uint64_t skipSize, const std::string &what);

    std::uint64_t totalSize() const { return totalSize_; }
    std::uint64_t skipSize() const { return skipSize_; }

private:
    std::uint64_t totalSize_;
    std::uint64_t skipSize_;
};

class LockConflictError : public DownloadError
{
public:
    explicit LockConflictError(const std::filesystem::path &path)
        : DownloadError(ErrorKind::LockConflict, "Lock conflict: " + path.string()), path_(path) {}

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};

class DaemonTransportError : public DownloadError
{
public:
    explicit DaemonTransportError(const std::string &message)
        : DownloadError(ErrorKind::DaemonTransport, message) {}
};

/**
 * Application-level error reported by the daemon in a JSON-RPC error object.
 */
class DaemonProtocolError : public DownloadError
{
public:
    DaemonProtocolError(long code, const std::string &message);

    long code() const { return code_; }
    const std::string &daemonMessage() const { return daemonMessage_; }

    /**
     * The one daemon code treated as a distinguished terminal condition.
     */
    bool isNotFound() const;

private:
    long code_;
    std::string daemonMessage_;
};

class RenewalFailedError : public DownloadError
{
public:
    explicit RenewalFailedError(const std::string &message)
        : DownloadError(ErrorKind::RenewalFailed, message) {}
};

class ConfigError : public DownloadError
{
public:
    explicit ConfigError(const std::string &message)
        : DownloadError(ErrorKind::Config, message) {}
};
