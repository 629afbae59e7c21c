#include "errors.hpp"

#include <fmt/core.h>

const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::TransientNetwork:
        return "transient network error";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::FileTooSmall:
        return "file too small";
    case ErrorKind::LockConflict:
        return "lock conflict";
    case ErrorKind::DaemonTransport:
        return "daemon transport error";
    case ErrorKind::DaemonProtocol:
        return "daemon protocol error";
    case ErrorKind::NotFound:
        return "not found";
    case ErrorKind::RenewalFailed:
        return "link renewal failed";
    case ErrorKind::Timeout:
        return "timed out";
    case ErrorKind::Storage:
        return "storage error";
    case ErrorKind::Resolve:
        return "link resolution failed";
    case ErrorKind::Config:
        return "configuration error";
    }
    return "unknown error";
}

bool isRetryable(ErrorKind kind)
{
    return kind == ErrorKind::TransientNetwork || kind == ErrorKind::DaemonTransport;
}

FileTooSmallError::FileTooSmallError(std::uint64_t totalSize, std::uint64_t skipSize, const std::string &what)
    : DownloadError(ErrorKind::FileTooSmall,
                    fmt::format("File too small ({} bytes < {} skip size): {}", totalSize, skipSize, what)),
      totalSize_(totalSize),
      skipSize_(skipSize)
{
}

DaemonProtocolError::DaemonProtocolError(long code, const std::string &message)
    : DownloadError(ErrorKind::DaemonProtocol, fmt::format("Aria2 RPC error ({}): {}", code, message)),
      code_(code),
      daemonMessage_(message)
{
}

bool DaemonProtocolError::isNotFound() const
{
    return code_ == DAEMON_NOT_FOUND_CODE;
}
