#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "http_transport.hpp"
#include "logger.hpp"
#include "progress.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

/**
 * Outcome of one successfully completed target.
 */
struct TransferResult
{
    std::filesystem::path localPath;
    std::uint64_t totalBytesWritten = 0; // Final size on disk, resumed bytes included
    bool resumed = false;                // Continued from a partial file
};

/**
 * Direct HTTP downloads with byte-range resume, retry and cooperative cancellation.
 * Files land in the download directory under the name derived from the URL.
 */
class TransferEngine
{
public:
    TransferEngine(HttpTransport &transport,
                   std::filesystem::path downloadDir,
                   RetryPolicy policy,
                   const Logger &logger,
                   ProgressSink &progress);

    /**
     * Download `url`, retrying retryable failures up to policy.maxRetries times.
     *
     * @param url Direct HTTP(S) URL
     * @param cancel Cancellation observed before each attempt, during waits and while streaming
     * @param skipSize Minimum total size (0 disables the check)
     * @return Result describing the completed file
     * @throws CancelledError, FileTooSmallError, TransferError (Storage, or the last retryable error)
     */
    TransferResult transfer(const std::string &url, CancellationSignal &cancel, std::uint64_t skipSize);

    /**
     * Attempts consumed by the last transfer() call.
     */
    int attemptCount() const { return attemptCount_; }

    /**
     * Local path a URL is downloaded to.
     */
    std::filesystem::path destinationFor(const std::string &url) const;

private:
    HttpTransport &transport_;
    std::filesystem::path downloadDir_;
    RetryPolicy policy_;
    const Logger &logger_;
    ProgressSink &progress_;
    int attemptCount_ = 0;

    /**
     * One request: resume decision, status check, size check, streaming.
     */
    TransferResult attempt(const std::string &url,
                           const std::filesystem::path &destination,
                           CancellationSignal &cancel,
                           std::uint64_t skipSize);
};
