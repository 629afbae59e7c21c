#pragma once

#include <string>
#include <utility>

#include <fmt/core.h>

/**
 * Console logger passed explicitly to every component.
 * Info and success lines go to stdout, warnings and errors to stderr.
 * Quiet mode (unattended runs) drops info/success; verbose mode adds debug lines.
 */
class Logger
{
public:
    enum class Level
    {
        Debug,
        Info,
        Success,
        Warning,
        Error
    };

    Logger() = default;
    Logger(bool quiet, bool verbose) : quiet_(quiet), verbose_(verbose) {}

    bool quiet() const { return quiet_; }
    bool verbose() const { return verbose_; }

    void setQuiet(bool quiet) { quiet_ = quiet; }
    void setVerbose(bool verbose) { verbose_ = verbose; }

    void log(Level level, const std::string &message) const;

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args &&...args) const
    {
        log(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args &&...args) const
    {
        log(Level::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void success(fmt::format_string<Args...> format, Args &&...args) const
    {
        log(Level::Success, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warning(fmt::format_string<Args...> format, Args &&...args) const
    {
        log(Level::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args &&...args) const
    {
        log(Level::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    bool enabled(Level level) const;

private:
    bool quiet_ = false;
    bool verbose_ = false;
};
