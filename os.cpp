// OS Utilities

#include "os.h"

#include <algorithm>
#include <ranges>
#include <system_error>

#include <fmt/std.h>

#include <sys/capability.h>
#include <sys/stat.h>
#include <unistd.h>

#include "log.h"
#include "scope_guard.h"

namespace fs = std::filesystem;

namespace os
{

std::optional<std::filesystem::path> find_binary(std::string_view name)
{
    std::string_view PATH = getenv("PATH") ? getenv("PATH") : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

    for(const auto dir : std::views::split(PATH, ':'))
    {
        auto dirView = std::string_view(dir.begin(), dir.end());
        if(dirView.empty())
            continue;

        auto path = fs::path(dirView) / fs::path(name);

        std::error_code ec;
        auto stat = fs::status(path, ec);

        if(ec)
            continue;

        if(stat.type() != fs::file_type::directory && (stat.permissions() & fs::perms::owner_exec) != fs::perms::none)
            return path;
    }

    return {};
}

bool chown_recursive(const std::filesystem::path& root, uid_t uid, gid_t gid)
{
    if(lchown(root.c_str(), uid, gid) != 0)
    {
        sys_error("Could not chown {} to {}:{}", root, uid, gid);
        return false;
    }

    std::error_code ec;
    auto it = fs::recursive_directory_iterator(root, fs::directory_options::none, ec);
    if(ec)
    {
        error("Could not iterate over {}: {}", root, ec.message());
        return false;
    }

    for(auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec))
    {
        if(ec)
        {
            error("Could not iterate over {}: {}", root, ec.message());
            return false;
        }

        const auto& path = it->path();
        if(lchown(path.c_str(), uid, gid) != 0)
        {
            sys_error("Could not chown {} to {}:{}", path, uid, gid);
            return false;
        }
    }

    if(ec)
    {
        error("Could not iterate over {}: {}", root, ec.message());
        return false;
    }

    return true;
}

bool write_to_fd(int fd, std::span<const unsigned char> data)
{
    std::size_t toWrite = data.size();
    const unsigned char* ptr = data.data();

    while(toWrite != 0)
    {
        auto ret = write(fd, ptr, toWrite);
        if(ret < 0 && errno == EINTR)
            continue;
        if(ret <= 0)
        {
            sys_error("Could not write()");
            return false;
        }

        ptr += ret;
        toWrite -= ret;
    }

    return true;
}

bool has_capability(int cap)
{
    cap_t caps = cap_get_proc();
    if(!caps)
    {
        sys_error("Could not get caps");
        return false;
    }

    auto guard = sg::make_scope_guard([&]{ cap_free(caps); });

    cap_flag_value_t value = CAP_CLEAR;
    if(cap_get_flag(caps, static_cast<cap_value_t>(cap), CAP_EFFECTIVE, &value) != 0)
    {
        sys_error("Could not query cap {}", cap);
        return false;
    }

    return value == CAP_SET;
}

bool capabilities_cleared()
{
    cap_t caps = cap_get_proc();
    if(!caps)
    {
        sys_error("Could not get caps");
        return false;
    }

    auto guard = sg::make_scope_guard([&]{ cap_free(caps); });

    cap_t empty = cap_init();
    if(!empty)
    {
        sys_error("Could not allocate caps");
        return false;
    }

    auto emptyGuard = sg::make_scope_guard([&]{ cap_free(empty); });

    int ret = cap_compare(caps, empty);
    if(ret < 0)
    {
        sys_error("Could not compare caps");
        return false;
    }

    // Inheritable caps do not matter after exec without ambient caps
    return !CAP_DIFFERS(ret, CAP_PERMITTED) && !CAP_DIFFERS(ret, CAP_EFFECTIVE);
}

}
