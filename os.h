// OS Utilities

#ifndef OS_H
#define OS_H

#include <array>
#include <concepts>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <ranges>
#include <span>
#include <string_view>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/ranges.h>

#include "log.h"

namespace os
{

template<std::convertible_to<const char*> ... Args>
[[nodiscard]]
pid_t fork_and_execv(const char* cmd, Args ... args)
{
    auto pid = fork();
    if(pid == 0)
    {
        auto argsCopy = std::to_array<char*>({
            strdup(cmd),
            strdup(args)...,
            static_cast<char*>(nullptr)
        });

        debug("Running {}", argsCopy | std::views::take(argsCopy.size()-1));

        execvp(cmd, argsCopy.data());
        sys_error("Could not run {}", cmd);
        _exit(127);
    }
    if(pid < 0)
        sys_error("Could not fork()");

    return pid;
}

//! Run a command and wait for it. Returns false on any failure or non-zero exit.
template<std::convertible_to<const char*> ... Args>
[[nodiscard]]
bool run(const char* cmd, Args&& ... args)
{
    auto pid = fork_and_execv(cmd, std::forward<Args>(args)...);
    if(pid < 0)
        return false;

    int wstatus = 0;
    if(waitpid(pid, &wstatus, 0) <= 0)
    {
        sys_error("Could not wait for cmd {}", cmd);
        return false;
    }

    if(!WIFEXITED(wstatus) || WEXITSTATUS(wstatus) != 0)
    {
        if(WIFEXITED(wstatus))
            error("{} failed with exit code {}", cmd, WEXITSTATUS(wstatus));
        else
            error("{} failed/crashed", cmd);
        return false;
    }

    return true;
}

[[nodiscard]]
std::optional<std::filesystem::path> find_binary(std::string_view name);

//! chown a whole tree without following symlinks
[[nodiscard]]
bool chown_recursive(const std::filesystem::path& root, uid_t uid, gid_t gid);

[[nodiscard]]
bool write_to_fd(int fd, std::span<const unsigned char> data);

[[nodiscard]]
bool has_capability(int cap);

//! True if the process holds no permitted capabilities anymore
[[nodiscard]]
bool capabilities_cleared();

}

#endif
