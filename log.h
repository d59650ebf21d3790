// Logging utilities

#ifndef LOG_H
#define LOG_H

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <fmt/format.h>
#include <fmt/color.h>

extern bool log_debug;
extern bool log_color;

// Decide on colored output (terminal && !NO_COLOR)
void log_init();

template<typename Level>
void log(FILE* file, Level&& level, const std::string& msg)
{
    fmt::print(file, "tiny_entrypoint[{}]: {}\n",
        std::forward<Level>(level), msg);
    std::fflush(file);
}

inline auto log_level(const char* name, fmt::color color)
{
    return fmt::styled(name, log_color ? fmt::fg(color) : fmt::text_style{});
}

template<typename ... Args>
void warning(const fmt::format_string<Args...>& format, Args&& ... args)
{
    log(stderr, log_level("WARNING", fmt::color::yellow), fmt::format(format, std::forward<Args>(args)...));
}

template<typename ... Args>
void error(const fmt::format_string<Args...>& format, Args&& ... args)
{
    log(stderr, log_level("ERROR", fmt::color::red), fmt::format(format, std::forward<Args>(args)...));
}

template<typename ... Args>
void sys_error(const fmt::format_string<Args...>& format, Args&& ... args)
{
    auto savedErrno = errno;

    log(stderr, log_level("ERROR", fmt::color::red),
        fmt::format("{}: {}",
            fmt::format(format, std::forward<Args>(args)...),
            strerror(savedErrno)
        )
    );
}

template<typename ... Args>
void info(const fmt::format_string<Args...>& format, Args&& ... args)
{
    log(stdout, log_level("INFO", fmt::color::green), fmt::format(format, std::forward<Args>(args)...));
}

template<typename ... Args>
void debug(const fmt::format_string<Args...>& format, Args&& ... args)
{
    if(!log_debug)
        return;

    log(stderr, log_level("DEBUG", fmt::color::orange), fmt::format(format, std::forward<Args>(args)...));
}

#endif
