// Workspace provisioning

#include "workspace.h"

#include <algorithm>
#include <system_error>

#include <grp.h>
#include <sys/statvfs.h>

#include <fmt/std.h>

#include "log.h"
#include "os.h"

namespace fs = std::filesystem;

namespace workspace
{

bool identityCanWrite(const struct stat& st, const identity::RuntimeIdentity& identity,
    std::span<const gid_t> groups)
{
    if(identity.uid == 0)
        return true;

    if(st.st_uid == identity.uid)
        return (st.st_mode & S_IWUSR) != 0;

    if(st.st_gid == identity.gid || std::ranges::find(groups, st.st_gid) != groups.end())
        return (st.st_mode & S_IWGRP) != 0;

    return (st.st_mode & S_IWOTH) != 0;
}

std::vector<gid_t> supplementaryGroups(const identity::RuntimeIdentity& identity)
{
    if(identity.username.empty())
        return {};

    std::vector<gid_t> groups(16);
    while(true)
    {
        int count = static_cast<int>(groups.size());
        if(getgrouplist(identity.username.c_str(), identity.gid, groups.data(), &count) >= 0)
        {
            groups.resize(count);
            return groups;
        }

        // count now holds the required size
        groups.resize(std::max<std::size_t>(count, groups.size() * 2));
    }
}

std::optional<bool> onReadOnlyMount(const std::filesystem::path& path)
{
    struct statvfs vfs{};
    if(statvfs(path.c_str(), &vfs) != 0)
    {
        sys_error("Could not statvfs {}", path);
        return {};
    }

    return (vfs.f_flag & ST_RDONLY) != 0;
}

Result provision(const std::filesystem::path& root, const std::string& project, const identity::RuntimeIdentity& identity)
{
    fs::path projectDir = root / project;

    std::error_code ec;
    auto status = fs::symlink_status(projectDir, ec);
    if(ec && ec != std::errc::no_such_file_or_directory)
    {
        error("Could not stat {}: {}", projectDir, ec.message());
        return Result::Failed;
    }

    if(fs::exists(status) && !fs::is_directory(fs::status(projectDir, ec)))
    {
        error("{} exists, but is not a directory", projectDir);
        return Result::Failed;
    }

    if(!fs::exists(status))
    {
        info("Creating default project directory {}", projectDir);

        fs::create_directories(projectDir, ec);
        if(ec)
        {
            error("Could not create {}: {}", projectDir, ec.message());
            return Result::Failed;
        }

        debug("Changing owner of {} to {}:{}", root, identity.uid, identity.gid);
        if(!os::chown_recursive(root, identity.uid, identity.gid))
            return Result::Failed;

        return Result::Created;
    }

    struct stat st{};
    if(stat(projectDir.c_str(), &st) != 0)
    {
        sys_error("Could not stat {}", projectDir);
        return Result::Failed;
    }

    auto readOnly = onReadOnlyMount(projectDir);
    if(!readOnly)
        return Result::Failed;

    if(*readOnly)
    {
        warning("The directory {} is on a read-only mount. "
            "Operations requiring write access may fail.", projectDir);
        return Result::NotWritable;
    }

    if(!identityCanWrite(st, identity, supplementaryGroups(identity)))
    {
        warning("The directory {} exists but does not have write permissions. "
            "Operations requiring write access may fail.", projectDir);
        return Result::NotWritable;
    }

    debug("{} exists and is writable", projectDir);
    return Result::Existing;
}

}
