#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

/**
 * Observer of transfer progress. Purely observational: never affects control flow.
 */
class ProgressSink
{
public:
    virtual ~ProgressSink() = default;

    /**
     * @param completed Bytes on disk so far (including resumed bytes)
     * @param total Expected total size, 0 if unknown
     * @param speed Current speed in bytes per second
     */
    virtual void onProgress(std::uint64_t completed, std::uint64_t total, std::uint64_t speed) = 0;

    /**
     * A new phase started (e.g. "throttled", "renewing").
     */
    virtual void onStateChange(std::string_view state) = 0;

    /**
     * The transfer ended; `outcome` is "done", "cancelled" or an error label.
     */
    virtual void onFinished(std::string_view outcome) = 0;
};

/**
 * Sink that discards everything (unattended runs, tests).
 */
class NullProgress : public ProgressSink
{
public:
    void onProgress(std::uint64_t, std::uint64_t, std::uint64_t) override {}
    void onStateChange(std::string_view) override {}
    void onFinished(std::string_view) override {}
};

/**
 * Progress bar on stdout. Redraws in place on a terminal,
 * prints a line per percent (at most once a second) otherwise.
 */
class ConsoleProgress : public ProgressSink
{
public:
    ConsoleProgress();

    void onProgress(std::uint64_t completed, std::uint64_t total, std::uint64_t speed) override;
    void onStateChange(std::string_view state) override;
    void onFinished(std::string_view outcome) override;

private:
    bool isTerminalOutput_ = true;
    bool lineOpen_ = false;
    std::string state_;
    double lastPrintedPercentage_ = -1.0;
    std::chrono::steady_clock::time_point lastPrintedTime_;
};

/**
 * Format bytes into human-readable string (e.g., "52.30 MB")
 */
std::string formatBytes(std::uint64_t bytes);

/**
 * Format duration into human-readable string (e.g., "2m 30s")
 */
std::string formatDuration(long seconds);
