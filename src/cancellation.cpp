#include "cancellation.hpp"

#include <csignal>
#include <pthread.h>

void CancellationSignal::cancel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancellationSignal::waitFor(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_.load(std::memory_order_acquire); });
}

namespace
{

sigset_t watchedSignals()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    // Used internally to wake the watcher thread on shutdown
    sigaddset(&set, SIGUSR1);
    return set;
}

} // namespace

SignalWatcher::SignalWatcher(CancellationSignal &signal) : signal_(signal)
{
    sigset_t set = watchedSignals();
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
    thread_ = std::thread(&SignalWatcher::run, this);
}

SignalWatcher::~SignalWatcher()
{
    stopping_.store(true);
    if (thread_.joinable())
    {
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }
}

void SignalWatcher::run()
{
    sigset_t set = watchedSignals();
    while (true)
    {
        int signum = 0;
        if (sigwait(&set, &signum) != 0)
        {
            continue;
        }
        if (signum == SIGUSR1)
        {
            if (stopping_.load())
            {
                return;
            }
            continue;
        }

        received_.store(signum);
        signal_.cancel();
    }
}
