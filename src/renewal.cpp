#include "renewal.hpp"
#include "errors.hpp"

#include <algorithm>
#include <utility>

#include <fmt/core.h>

const char *renewalStateName(RenewalState state)
{
    switch (state)
    {
    case RenewalState::Probing:
        return "probing";
    case RenewalState::ThrottledSegment:
        return "throttled";
    case RenewalState::Renewing:
        return "renewing";
    case RenewalState::UnthrottledSegment:
        return "unthrottled";
    case RenewalState::Completed:
        return "completed";
    case RenewalState::Failed:
        return "failed";
    case RenewalState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

bool RenewalTracker::isTerminal() const
{
    return state_ == RenewalState::Completed || state_ == RenewalState::Failed ||
           state_ == RenewalState::Cancelled;
}

RenewalState RenewalTracker::transition(RenewalState from, RenewalState to)
{
    if (state_ == from)
    {
        state_ = to;
    }
    return state_;
}

RenewalState RenewalTracker::startSegmented()
{
    return transition(RenewalState::Probing, RenewalState::ThrottledSegment);
}

RenewalState RenewalTracker::startSingle()
{
    return transition(RenewalState::Probing, RenewalState::UnthrottledSegment);
}

RenewalState RenewalTracker::observe(const DaemonStatus &status)
{
    if (state_ != RenewalState::ThrottledSegment && state_ != RenewalState::UnthrottledSegment)
    {
        return state_;
    }

    if (status.isNotFound() || status.isFailed())
    {
        state_ = RenewalState::Failed;
        return state_;
    }

    bool reachedEnd = status.isComplete() ||
                      (status.totalBytes > 0 && status.completedBytes >= status.totalBytes);

    if (state_ == RenewalState::ThrottledSegment)
    {
        if (!renewed_ && status.totalBytes > 0 && status.fraction() >= threshold_)
        {
            state_ = RenewalState::Renewing;
        }
        else if (reachedEnd)
        {
            // Only reachable when the daemon never learned the size
            state_ = RenewalState::Completed;
        }
        return state_;
    }

    if (reachedEnd)
    {
        state_ = RenewalState::Completed;
    }
    return state_;
}

RenewalState RenewalTracker::renewalSucceeded()
{
    if (state_ == RenewalState::Renewing)
    {
        renewed_ = true;
        state_ = RenewalState::UnthrottledSegment;
    }
    return state_;
}

RenewalState RenewalTracker::fail()
{
    if (!isTerminal())
    {
        state_ = RenewalState::Failed;
    }
    return state_;
}

RenewalState RenewalTracker::cancel()
{
    if (!isTerminal())
    {
        state_ = RenewalState::Cancelled;
    }
    return state_;
}

RenewalDriver::RenewalDriver(DownloadDaemon &daemon,
                             LinkResolver &resolver,
                             std::filesystem::path downloadDir,
                             RenewalSettings settings,
                             const Logger &logger,
                             ProgressSink &progress)
    : daemon_(daemon),
      resolver_(resolver),
      downloadDir_(std::move(downloadDir)),
      settings_(settings),
      logger_(logger),
      progress_(progress)
{
}

void RenewalDriver::discard(const DaemonTaskId &task)
{
    try
    {
        daemon_.remove(task);
    }
    catch (const DownloadError &e)
    {
        logger_.debug("Removing daemon task {} failed: {}", task, e.what());
    }
    try
    {
        daemon_.purgeResult(task);
    }
    catch (const DownloadError &e)
    {
        logger_.debug("Purging daemon task {} failed: {}", task, e.what());
    }
}

TransferResult RenewalDriver::download(const std::string &target,
                                       CancellationSignal &cancel,
                                       bool unattended,
                                       std::uint64_t skipSize)
{
    RenewalTracker tracker(settings_.renewalThreshold);
    lastState_ = tracker.state();
    renewals_ = 0;

    // 1. Nothing to do once cancellation is raised
    if (cancel.isCancelled())
    {
        lastState_ = tracker.cancel();
        throw CancelledError();
    }

    progress_.onStateChange(renewalStateName(RenewalState::Probing));

    // 2. Resolve a direct link and probe it for size and filename
    std::string url;
    ProbeResult probe;
    try
    {
        url = resolver_.resolve(target);
        probe = resolver_.probe(url);
    }
    catch (const DownloadError &)
    {
        lastState_ = tracker.fail();
        progress_.onFinished(renewalStateName(lastState_));
        throw;
    }

    // 3. Reject files below the skip size before anything reaches the daemon
    if (skipSize > 0 && probe.size && *probe.size < skipSize)
    {
        lastState_ = tracker.fail();
        progress_.onFinished(errorKindName(ErrorKind::FileTooSmall));
        throw FileTooSmallError(*probe.size, skipSize, target);
    }

    // 4. Both segments write the same file so the daemon resumes the partial bytes
    DaemonOptions options;
    options.dir = downloadDir_.string();
    options.out = probe.name;
    options.continuePartial = true;

    // 5. Pick the flow: one uncapped submission, or a capped first segment
    bool sizeKnown = probe.size && *probe.size > 0;
    bool single = !sizeKnown || (unattended && *probe.size < settings_.smallFileThreshold);
    if (single)
    {
        lastState_ = tracker.startSingle();
    }
    else
    {
        lastState_ = tracker.startSegmented();
        // Slow enough that the renewal threshold cannot be crossed between two polls
        options.maxDownloadLimit = std::max<std::uint64_t>(1, *probe.size / settings_.bandwidthDivisor);
    }

    logger_.info("{} -> {} ({}{})",
                 target,
                 probe.name,
                 sizeKnown ? formatBytes(*probe.size) : std::string("size unknown"),
                 single ? ", single segment" : "");

    // The whole daemon phase is bounded; small files get the shorter limit
    auto deadline = std::chrono::steady_clock::now() +
                    (single ? settings_.smallFileTimeout : settings_.overallTimeout);

    // 6. Submit and poll; every failure exit removes whatever task is live
    DaemonTaskId task;
    try
    {
        task = daemon_.submitByUri({url}, options);
        progress_.onStateChange(renewalStateName(lastState_));
        logger_.debug("Submitted {} as daemon task {}", probe.name, task);

        TransferResult result = poll(target, task, options, tracker, probe, cancel, deadline);
        lastState_ = tracker.state();
        progress_.onFinished("done");
        return result;
    }
    catch (const DownloadError &e)
    {
        lastState_ = e.kind() == ErrorKind::Cancelled ? tracker.cancel() : tracker.fail();
        if (!task.empty())
        {
            discard(task);
        }
        progress_.onFinished(renewalStateName(lastState_));
        throw;
    }
}

TransferResult RenewalDriver::poll(const std::string &target,
                                   DaemonTaskId &task,
                                   DaemonOptions &options,
                                   RenewalTracker &tracker,
                                   const ProbeResult &probe,
                                   CancellationSignal &cancel,
                                   std::chrono::steady_clock::time_point deadline)
{
    while (true)
    {
        // Sleep one poll interval; cancellation cuts the sleep short
        if (cancel.waitFor(settings_.pollInterval))
        {
            throw CancelledError(fmt::format("Download cancelled: {}", target));
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            throw DownloadError(ErrorKind::Timeout, fmt::format("Daemon download timed out: {}", target));
        }

        // Report every sample, then let the tracker decide the next state
        DaemonStatus status = daemon_.status(task);
        std::uint64_t total = status.totalBytes > 0 ? status.totalBytes : probe.size.value_or(0);
        progress_.onProgress(status.completedBytes, total, status.speedBytesPerSec);

        RenewalState next = tracker.observe(status);
        lastState_ = next;

        switch (next)
        {
        case RenewalState::Renewing:
        {
            progress_.onStateChange(renewalStateName(next));
            logger_.info("Renewing link for {} at {:.0f}%", probe.name, status.fraction() * 100.0);

            // Drop the task on the expiring link (best-effort)
            DaemonTaskId expiring = std::exchange(task, DaemonTaskId());
            discard(expiring);

            // A fresh link is mandatory; without it the download cannot continue
            std::string freshUrl;
            try
            {
                freshUrl = resolver_.resolve(target);
            }
            catch (const DownloadError &e)
            {
                throw RenewalFailedError(fmt::format("Link renewal failed for {}: {}", target, e.what()));
            }

            // Give the daemon a tick to release the output file
            if (cancel.waitFor(settings_.pollInterval))
            {
                throw CancelledError(fmt::format("Download cancelled: {}", target));
            }

            // Same dir and out, no cap: the daemon continues the partial file
            options.maxDownloadLimit.reset();
            task = daemon_.submitByUri({freshUrl}, options);
            lastState_ = tracker.renewalSucceeded();
            ++renewals_;
            progress_.onStateChange(renewalStateName(lastState_));
            logger_.debug("Resubmitted {} as daemon task {}", probe.name, task);
            break;
        }
        case RenewalState::Completed:
        {
            // Keep the daemon's result list clean; a failed purge does not fail the download
            try
            {
                daemon_.purgeResult(task);
            }
            catch (const DownloadError &e)
            {
                logger_.debug("Purging daemon task {} failed: {}", task, e.what());
            }
            task.clear();

            TransferResult result;
            result.localPath = downloadDir_ / probe.name;
            result.totalBytesWritten = status.completedBytes;
            result.resumed = tracker.renewed();
            return result;
        }
        case RenewalState::Failed:
            if (status.isNotFound())
            {
                throw DownloadError(ErrorKind::NotFound,
                                    fmt::format("Daemon reported resource not found for {}: {}",
                                                target, status.errorMessage));
            }
            throw DaemonProtocolError(status.errorCode.value_or(0),
                                      status.errorMessage.empty()
                                          ? fmt::format("daemon task {} ended in state '{}'", task, status.state)
                                          : status.errorMessage);
        default:
            break;
        }
    }
}
