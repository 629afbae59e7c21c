#include "progress.hpp"

#include <cstdio>
#include <unistd.h>

#include <fmt/core.h>

ConsoleProgress::ConsoleProgress()
{
    // Detect if stdout is a terminal to decide how we render the progress bar
    isTerminalOutput_ = ::isatty(fileno(stdout));
}

void ConsoleProgress::onProgress(std::uint64_t completed, std::uint64_t total, std::uint64_t speed)
{
    auto now = std::chrono::steady_clock::now();
    bool isComplete = (total > 0 && completed >= total);

    // Update the terminal at most 5 times per second
    if (isTerminalOutput_ && !isComplete && now - lastPrintedTime_ < std::chrono::milliseconds(200))
    {
        return;
    }

    std::string speedStr;
    if (speed >= 1024 * 1024)
    {
        speedStr = fmt::format("{:.2f} MB/s", speed / (1024.0 * 1024.0));
    }
    else if (speed >= 1024)
    {
        speedStr = fmt::format("{:.2f} KB/s", speed / 1024.0);
    }
    else
    {
        speedStr = fmt::format("{} B/s", speed);
    }

    std::string prefix = state_.empty() ? std::string() : fmt::format("[{}] ", state_);

    // Unknown size: show only the running total
    if (total == 0)
    {
        if (isTerminalOutput_)
        {
            fmt::print("\r{}Downloaded: {} | {}\033[K", prefix, formatBytes(completed), speedStr);
            std::fflush(stdout);
            lineOpen_ = true;
            lastPrintedTime_ = now;
        }
        else if (now - lastPrintedTime_ >= std::chrono::seconds(1))
        {
            fmt::print("{}Downloaded: {} | {}\n", prefix, formatBytes(completed), speedStr);
            lastPrintedTime_ = now;
        }
        return;
    }

    double percentage = (static_cast<double>(completed) / static_cast<double>(total)) * 100.0;

    // Avoid over-printing in non-terminal environments
    if (!isTerminalOutput_ && !isComplete)
    {
        if (now - lastPrintedTime_ < std::chrono::seconds(1))
        {
            return;
        }
        if (lastPrintedPercentage_ >= 0.0 && percentage < lastPrintedPercentage_ + 1.0)
        {
            return;
        }
    }

    long eta = (speed > 0 && total > completed) ? static_cast<long>((total - completed) / speed) : 0;

    // Create progress bar (50 characters wide)
    int barWidth = 50;
    int filled = static_cast<int>((percentage / 100.0) * barWidth);
    std::string bar = "[";
    for (int i = 0; i < barWidth; ++i)
    {
        if (i < filled)
        {
            bar += "=";
        }
        else if (i == filled)
        {
            bar += ">";
        }
        else
        {
            bar += " ";
        }
    }
    bar += "]";

    if (isTerminalOutput_)
    {
        fmt::print("\r{}{} {:.1f}% | {} / {} | {} | ETA: {}\033[K",
                   prefix,
                   bar,
                   percentage,
                   formatBytes(completed),
                   formatBytes(total),
                   speedStr,
                   formatDuration(eta));
        std::fflush(stdout);
        lineOpen_ = true;
    }
    else
    {
        fmt::print("{}{} {:.1f}% | {} / {} | {} | ETA: {}\n",
                   prefix,
                   bar,
                   percentage,
                   formatBytes(completed),
                   formatBytes(total),
                   speedStr,
                   formatDuration(eta));
    }

    lastPrintedTime_ = now;
    lastPrintedPercentage_ = percentage;
}

void ConsoleProgress::onStateChange(std::string_view state)
{
    state_ = std::string(state);
    lastPrintedPercentage_ = -1.0;
}

void ConsoleProgress::onFinished(std::string_view outcome)
{
    if (lineOpen_)
    {
        // Print newline after progress bar
        fmt::print("\n");
        lineOpen_ = false;
    }
    if (outcome != "done")
    {
        fmt::print("Transfer {}\n", outcome);
    }
    state_.clear();
    lastPrintedPercentage_ = -1.0;
}

std::string formatBytes(std::uint64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    if (bytes >= GB)
    {
        return fmt::format("{:.2f} GB", bytes / GB);
    }
    else if (bytes >= MB)
    {
        return fmt::format("{:.2f} MB", bytes / MB);
    }
    else if (bytes >= KB)
    {
        return fmt::format("{:.2f} KB", bytes / KB);
    }
    else
    {
        return fmt::format("{} B", bytes);
    }
}

std::string formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        long minutes = seconds / 60;
        long secs = seconds % 60;
        return fmt::format("{}m {}s", minutes, secs);
    }
    else
    {
        long hours = seconds / 3600;
        long minutes = (seconds % 3600) / 60;
        return fmt::format("{}h {}m", hours, minutes);
    }
}
