#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

/**
 * One-way cancellation flag shared by everything taking part in a run.
 * Once cancel() is called it stays raised; every sleep in the subsystem
 * goes through waitFor() so it wakes up as soon as the flag is raised.
 */
class CancellationSignal
{
public:
    CancellationSignal() = default;

    CancellationSignal(const CancellationSignal &) = delete;
    CancellationSignal &operator=(const CancellationSignal &) = delete;

    /**
     * Raise the flag and wake all waiters. Idempotent.
     */
    void cancel();

    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /**
     * Sleep for up to `duration`.
     *
     * @return true if cancellation was raised before or during the wait
     */
    bool waitFor(std::chrono::milliseconds duration);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * Translates SIGINT/SIGTERM into a cancellation.
 *
 * The constructor blocks both signals for the calling thread (and every thread
 * created afterwards) and starts a thread that waits for them with sigwait().
 * Construct it in main() before any other thread exists.
 */
class SignalWatcher
{
public:
    explicit SignalWatcher(CancellationSignal &signal);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher &) = delete;
    SignalWatcher &operator=(const SignalWatcher &) = delete;

    /**
     * Signal number that triggered the cancellation, 0 if none did.
     */
    int receivedSignal() const { return received_.load(); }

private:
    void run();

    CancellationSignal &signal_;
    std::atomic<int> received_{0};
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};
