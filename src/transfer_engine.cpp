#include "transfer_engine.hpp"
#include "errors.hpp"
#include "target.hpp"

#include <chrono>
#include <exception>
#include <fstream>
#include <optional>
#include <utility>

#include <fmt/core.h>

namespace
{

/**
 * Writes one response body to disk and records why it stopped, if it did.
 * Callbacks never throw: libcurl is a C library, so errors are parked in
 * `error` and rethrown by the engine once the transport returns.
 */
class FileSink : public StreamHandler
{
public:
    FileSink(std::filesystem::path destination,
             std::uint64_t offset,
             std::uint64_t skipSize,
             const std::string &url,
             CancellationSignal &cancel,
             ProgressSink &progress)
        : destination_(std::move(destination)),
          offset_(offset),
          skipSize_(skipSize),
          url_(url),
          cancel_(cancel),
          progress_(progress),
          startTime_(std::chrono::steady_clock::now())
    {
    }

    bool onResponse(long status,
                    std::optional<std::uint64_t> contentLength,
                    std::optional<std::uint64_t> rangeStart) override
    {
        // Only "206 from our offset" or "200 from zero" are usable
        bool resuming = offset_ > 0 && status == 206;
        if (!resuming && status != 200)
        {
            return fail(TransferError(ErrorKind::TransientNetwork, fmt::format("HTTP {} for {}", status, url_)));
        }

        // Appending a range that starts elsewhere would corrupt the file
        if (resuming && rangeStart != offset_)
        {
            return fail(TransferError(ErrorKind::TransientNetwork,
                                      fmt::format("Server answered range from {} instead of {} for {}",
                                                  rangeStart ? fmt::format("{}", *rangeStart) : std::string("?"),
                                                  offset_,
                                                  url_)));
        }

        if (offset_ > 0 && status == 200)
        {
            // Server ignored the Range header and sent the whole file
            offset_ = 0;
        }
        resumed_ = offset_ > 0;

        if (contentLength)
        {
            totalSize_ = offset_ + *contentLength;
        }

        // Checked before the file is touched so a partial file survives
        if (skipSize_ > 0 && totalSize_ && *totalSize_ < skipSize_)
        {
            return fail(FileTooSmallError(*totalSize_, skipSize_, url_));
        }

        try
        {
            auto parent = destination_.parent_path();
            if (!parent.empty())
            {
                std::filesystem::create_directories(parent);
            }
        }
        catch (const std::filesystem::filesystem_error &e)
        {
            return fail(TransferError(ErrorKind::Storage,
                                      fmt::format("Cannot create directory for {}: {}", destination_.string(), e.what())));
        }

        // Append when resuming, truncate otherwise
        std::ios::openmode mode = std::ios::binary | (resumed_ ? std::ios::app : std::ios::trunc);
        file_.open(destination_, mode);
        if (!file_)
        {
            return fail(TransferError(ErrorKind::Storage,
                                      fmt::format("Cannot open file for writing: {}", destination_.string())));
        }

        written_ = offset_;
        progress_.onProgress(written_, totalSize_.value_or(0), 0);
        return true;
    }

    bool onData(const char *data, std::size_t size) override
    {
        file_.write(data, static_cast<std::streamsize>(size));
        if (!file_.good())
        {
            return fail(TransferError(ErrorKind::Storage,
                                      fmt::format("Write to {} failed (disk full or permission denied)",
                                                  destination_.string())));
        }

        written_ += size;
        receivedThisAttempt_ += size;

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime_).count();
        auto speed = elapsed > 0.0 ? static_cast<std::uint64_t>(receivedThisAttempt_ / elapsed) : 0;
        progress_.onProgress(written_, totalSize_.value_or(0), speed);
        return true;
    }

    bool shouldAbort() override
    {
        return cancel_.isCancelled();
    }

    /**
     * Flush and close; true if the data reached the file.
     */
    bool close()
    {
        if (!file_.is_open())
        {
            return true;
        }
        file_.flush();
        bool ok = file_.good();
        file_.close();
        return ok;
    }

    const std::exception_ptr &error() const { return error_; }
    std::uint64_t written() const { return written_; }
    std::optional<std::uint64_t> totalSize() const { return totalSize_; }
    bool resumed() const { return resumed_; }

private:
    template <typename Error>
    bool fail(Error error)
    {
        error_ = std::make_exception_ptr(std::move(error));
        return false;
    }

    std::filesystem::path destination_;
    std::uint64_t offset_;
    std::uint64_t skipSize_;
    const std::string &url_;
    CancellationSignal &cancel_;
    ProgressSink &progress_;
    std::chrono::steady_clock::time_point startTime_;

    std::ofstream file_;
    std::exception_ptr error_;
    std::optional<std::uint64_t> totalSize_;
    std::uint64_t written_ = 0;
    std::uint64_t receivedThisAttempt_ = 0;
    bool resumed_ = false;
};

} // namespace

TransferEngine::TransferEngine(HttpTransport &transport,
                               std::filesystem::path downloadDir,
                               RetryPolicy policy,
                               const Logger &logger,
                               ProgressSink &progress)
    : transport_(transport),
      downloadDir_(std::move(downloadDir)),
      policy_(policy),
      logger_(logger),
      progress_(progress)
{
}

std::filesystem::path TransferEngine::destinationFor(const std::string &url) const
{
    return downloadDir_ / filenameFromUrl(url);
}

TransferResult TransferEngine::transfer(const std::string &url, CancellationSignal &cancel, std::uint64_t skipSize)
{
    attemptCount_ = 0;
    std::filesystem::path destination = destinationFor(url);

    ErrorKind lastKind = ErrorKind::TransientNetwork;
    std::string lastMessage;

    // Up to maxRetries + 1 attempts, each one resuming from whatever is on disk
    for (int attemptIndex = 0; attemptIndex <= policy_.maxRetries; ++attemptIndex)
    {
        // 1. A raised signal consumes no attempt
        if (cancel.isCancelled())
        {
            throw CancelledError();
        }

        // 2. Fixed delay between attempts, cut short by cancellation
        if (attemptIndex > 0)
        {
            logger_.warning("Retry {}/{} for {}", attemptIndex, policy_.maxRetries, url);
            if (cancel.waitFor(policy_.retryDelay))
            {
                throw CancelledError();
            }
        }

        ++attemptCount_;
        try
        {
            TransferResult result = attempt(url, destination, cancel, skipSize);
            progress_.onFinished("done");
            return result;
        }
        catch (const DownloadError &e)
        {
            // 3. Cancelled, FileTooSmall and Storage end this target immediately
            if (!isRetryable(e.kind()))
            {
                progress_.onFinished(e.kind() == ErrorKind::Cancelled ? "cancelled" : errorKindName(e.kind()));
                throw;
            }
            logger_.warning("Download attempt {}/{} failed: {}", attemptCount_, policy_.maxRetries + 1, e.what());
            lastKind = e.kind();
            lastMessage = e.what();
        }
    }

    progress_.onFinished("failed");
    throw TransferError(lastKind, fmt::format("Download failed after {} attempts: {}", attemptCount_, lastMessage));
}

TransferResult TransferEngine::attempt(const std::string &url,
                                       const std::filesystem::path &destination,
                                       CancellationSignal &cancel,
                                       std::uint64_t skipSize)
{
    // Resume offset is the on-disk size right now
    std::uint64_t offset = 0;
    std::error_code ec;
    if (std::filesystem::is_regular_file(destination, ec))
    {
        auto size = std::filesystem::file_size(destination, ec);
        if (!ec)
        {
            offset = static_cast<std::uint64_t>(size);
        }
    }

    if (offset > 0)
    {
        logger_.info("Found partial download ({}), resuming {}", formatBytes(offset), destination.filename().string());
    }

    // Stream the body; the sink decides resume vs restart from the status line
    progress_.onStateChange("downloading");
    FileSink sink(destination, offset, skipSize, url, cancel, progress_);
    StreamOutcome outcome = transport_.get(url, offset, sink);
    bool flushed = sink.close(); // Flush even on failure so a partial file can be resumed

    // Errors raised inside the callbacks take precedence over the transport outcome
    if (sink.error())
    {
        std::rethrow_exception(sink.error());
    }

    if (outcome == StreamOutcome::Aborted)
    {
        throw CancelledError(fmt::format("Download cancelled: {} ({} written)", url, formatBytes(sink.written())));
    }

    if (!flushed)
    {
        throw TransferError(ErrorKind::Storage, fmt::format("Flushing {} failed", destination.string()));
    }

    // Connection closed early without curl noticing
    if (sink.totalSize() && sink.written() != *sink.totalSize())
    {
        throw TransferError(ErrorKind::TransientNetwork,
                            fmt::format("Short read: expected {} but got {}",
                                        formatBytes(*sink.totalSize()),
                                        formatBytes(sink.written())));
    }

    TransferResult result;
    result.localPath = destination;
    result.totalBytesWritten = sink.written();
    result.resumed = sink.resumed();
    return result;
}
