#include "logger.hpp"

#include <cstdio>

bool Logger::enabled(Level level) const
{
    switch (level)
    {
    case Level::Debug:
        return verbose_;
    case Level::Info:
    case Level::Success:
        return !quiet_;
    case Level::Warning:
    case Level::Error:
        return true;
    }
    return true;
}

void Logger::log(Level level, const std::string &message) const
{
    if (!enabled(level))
    {
        return;
    }

    switch (level)
    {
    case Level::Debug:
        fmt::print(stderr, "[debug] {}\n", message);
        break;
    case Level::Info:
        fmt::print("{}\n", message);
        break;
    case Level::Success:
        fmt::print("✓ {}\n", message);
        break;
    case Level::Warning:
        fmt::print(stderr, "Warning: {}\n", message);
        break;
    case Level::Error:
        fmt::print(stderr, "✗ {}\n", message);
        break;
    }
}
