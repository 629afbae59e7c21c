#include "batch_runner.hpp"
#include "target.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

#include <fmt/core.h>

std::size_t BatchReport::failedCount() const
{
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                                  [](const TargetOutcome &o) { return !o.succeeded(); }));
}

BatchRunner::BatchRunner(TransferEngine &engine,
                         RenewalDriver &driver,
                         AdvisoryLock lock,
                         RetryPolicy policy,
                         std::vector<std::string> providerDomains,
                         const Logger &logger,
                         FolderExpander expander)
    : engine_(engine),
      driver_(driver),
      lock_(std::move(lock)),
      policy_(policy),
      providerDomains_(std::move(providerDomains)),
      logger_(logger),
      expander_(std::move(expander))
{
}

BatchReport BatchRunner::runFromFile(const std::filesystem::path &path,
                                     CancellationSignal &cancel,
                                     bool unattended,
                                     std::uint64_t skipSize)
{
    std::vector<std::string> targets = readTargetFile(path);
    logger_.debug("Read {} target(s) from {}", targets.size(), path.string());
    return run(targets, cancel, unattended, skipSize);
}

std::vector<std::string> BatchRunner::expandFolder(const std::string &folder)
{
    if (!expander_)
    {
        throw DownloadError(ErrorKind::Resolve, "Folder targets are not supported without a folder expander");
    }
    std::vector<std::string> files = expander_(folder);
    logger_.info("Folder {} expanded to {} file(s)", folder, files.size());
    return files;
}

BatchReport BatchRunner::run(const std::vector<std::string> &targets,
                             CancellationSignal &cancel,
                             bool unattended,
                             std::uint64_t skipSize)
{
    // Held until the report is returned, whatever happens to the targets
    LockGuard guard = lock_.acquire();
    logger_.debug("Acquired lock {}", guard.path().string());

    BatchReport report;
    std::vector<std::string> queue = targets;

    for (std::size_t i = 0; i < queue.size(); ++i)
    {
        // Checked at every target, folders included
        if (cancel.isCancelled())
        {
            report.cancelled = true;
            break;
        }

        const std::string target = queue[i];

        // Folders are replaced in place by their files, keeping input order
        if (classifyTarget(target, providerDomains_) == TargetKind::ProviderFolder)
        {
            try
            {
                std::vector<std::string> files = expandFolder(target);
                queue.insert(queue.begin() + static_cast<std::ptrdiff_t>(i) + 1, files.begin(), files.end());
            }
            catch (const DownloadError &e)
            {
                logger_.error("{}: {}", target, e.what());
                TargetOutcome failure;
                failure.target = target;
                failure.kind = e.kind();
                failure.error = e.what();
                report.outcomes.push_back(std::move(failure));
            }
            continue;
        }

        logger_.info("[{}/{}] {}", i + 1, queue.size(), target);

        TargetOutcome outcome = dispatch(target, cancel, unattended, skipSize);
        if (outcome.succeeded())
        {
            logger_.success("Saved {} ({} bytes{})",
                            outcome.result->localPath.string(),
                            outcome.result->totalBytesWritten,
                            outcome.result->resumed ? ", resumed" : "");
            report.results.push_back(*outcome.result);
        }
        else if (outcome.kind == ErrorKind::Cancelled)
        {
            logger_.warning("Cancelled: {}", target);
        }
        else
        {
            logger_.error("Failed after {} attempt(s): {}", outcome.attempts, outcome.error);
        }

        // Cancellation stops dispatch; any other failure only ends this target
        bool stop = !outcome.succeeded() && outcome.kind == ErrorKind::Cancelled;
        report.outcomes.push_back(std::move(outcome));
        if (stop)
        {
            report.cancelled = true;
            break;
        }
    }

    logger_.info("Completed: {}/{} downloads succeeded.", report.results.size(), report.outcomes.size());
    if (report.cancelled)
    {
        logger_.warning("Batch cancelled, remaining targets were not started");
    }
    return report;
}

TargetOutcome BatchRunner::dispatch(const std::string &target,
                                    CancellationSignal &cancel,
                                    bool unattended,
                                    std::uint64_t skipSize)
{
    if (classifyTarget(target, providerDomains_) == TargetKind::ProviderFile)
    {
        return downloadProviderFile(target, cancel, unattended, skipSize);
    }

    TargetOutcome outcome;
    outcome.target = target;
    try
    {
        outcome.result = engine_.transfer(target, cancel, skipSize);
    }
    catch (const DownloadError &e)
    {
        outcome.kind = e.kind();
        outcome.error = e.what();
    }
    outcome.attempts = engine_.attemptCount();
    return outcome;
}

TargetOutcome BatchRunner::downloadProviderFile(const std::string &target,
                                                CancellationSignal &cancel,
                                                bool unattended,
                                                std::uint64_t skipSize)
{
    TargetOutcome outcome;
    outcome.target = target;

    for (int attemptIndex = 0; attemptIndex <= policy_.maxRetries; ++attemptIndex)
    {
        if (attemptIndex > 0)
        {
            logger_.warning("Retry {}/{} for {}", attemptIndex, policy_.maxRetries, target);
            if (cancel.waitFor(policy_.retryDelay))
            {
                outcome.kind = ErrorKind::Cancelled;
                outcome.error = "Download cancelled";
                return outcome;
            }
        }

        ++outcome.attempts;
        try
        {
            outcome.result = driver_.download(target, cancel, unattended, skipSize);
            return outcome;
        }
        catch (const DownloadError &e)
        {
            outcome.kind = e.kind();
            outcome.error = e.what();
            if (!isRetryable(e.kind()))
            {
                return outcome;
            }
            logger_.warning("Download attempt {}/{} failed: {}", outcome.attempts, policy_.maxRetries + 1, e.what());
        }
    }

    outcome.error = fmt::format("Download failed after {} attempts: {}", outcome.attempts, outcome.error);
    return outcome;
}
