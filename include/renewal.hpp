#pragma once

#include "aria2_client.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "link_resolver.hpp"
#include "logger.hpp"
#include "progress.hpp"
#include "transfer_engine.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

enum class RenewalState
{
    Probing,
    ThrottledSegment,
    Renewing,
    UnthrottledSegment,
    Completed,
    Failed,
    Cancelled
};

const char *renewalStateName(RenewalState state);

/**
 * Pure state machine of the segmented provider download.
 * Fed with daemon status snapshots; performs no I/O.
 *
 *   Probing -> ThrottledSegment -> Renewing -> UnthrottledSegment -> Completed
 *   Probing -> UnthrottledSegment (single uncapped submission, never renews)
 *   any non-terminal state -> Failed | Cancelled
 */
class RenewalTracker
{
public:
    explicit RenewalTracker(double threshold = 0.25) : threshold_(threshold) {}

    RenewalState state() const { return state_; }

    /**
     * The link has been renewed once; further samples never trigger Renewing.
     */
    bool renewed() const { return renewed_; }

    bool isTerminal() const;

    RenewalState startSegmented();
    RenewalState startSingle();

    /**
     * Advance on a status sample. Only segment states react to samples.
     */
    RenewalState observe(const DaemonStatus &status);

    /**
     * The fresh link was submitted: Renewing -> UnthrottledSegment.
     */
    RenewalState renewalSucceeded();

    RenewalState fail();
    RenewalState cancel();

private:
    RenewalState transition(RenewalState from, RenewalState to);

    double threshold_;
    RenewalState state_ = RenewalState::Probing;
    bool renewed_ = false;
};

/**
 * Downloads throttled-provider files through the daemon, swapping the direct
 * link for a fresh one once a quarter of the file has been fetched.
 */
class RenewalDriver
{
public:
    RenewalDriver(DownloadDaemon &daemon,
                  LinkResolver &resolver,
                  std::filesystem::path downloadDir,
                  RenewalSettings settings,
                  const Logger &logger,
                  ProgressSink &progress);

    /**
     * @param target Provider file page URL
     * @param cancel Observed on every poll tick
     * @param unattended Enables the small-file shortcut
     * @param skipSize Minimum size (0 disables); smaller files fail before any submission
     * @throws CancelledError, FileTooSmallError, RenewalFailedError, DownloadError (NotFound, Timeout,
     *         Resolve, TransientNetwork), DaemonProtocolError, DaemonTransportError
     */
    TransferResult download(const std::string &target,
                            CancellationSignal &cancel,
                            bool unattended,
                            std::uint64_t skipSize);

    RenewalState lastState() const { return lastState_; }
    int lastRenewalCount() const { return renewals_; }

private:
    TransferResult poll(const std::string &target,
                        DaemonTaskId &task,
                        DaemonOptions &options,
                        RenewalTracker &tracker,
                        const ProbeResult &probe,
                        CancellationSignal &cancel,
                        std::chrono::steady_clock::time_point deadline);

    /**
     * Best-effort removal of a task and its result; failures are logged.
     */
    void discard(const DaemonTaskId &task);

    DownloadDaemon &daemon_;
    LinkResolver &resolver_;
    std::filesystem::path downloadDir_;
    RenewalSettings settings_;
    const Logger &logger_;
    ProgressSink &progress_;

    RenewalState lastState_ = RenewalState::Probing;
    int renewals_ = 0;
};
