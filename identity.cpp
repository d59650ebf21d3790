// Identity provisioning: make sure a group and user exist for our uid/gid

#include "identity.h"

#include <cerrno>
#include <vector>

#include <grp.h>
#include <pwd.h>
#include <unistd.h>

#include <fmt/std.h>

#include "log.h"
#include "os.h"

namespace identity
{

namespace
{
    std::size_t bufferSize(int name)
    {
        long size = sysconf(name);
        return size > 0 ? static_cast<std::size_t>(size) : 16384;
    }
}

std::optional<GroupEntry> SystemDatabase::groupByGID(gid_t gid) const
{
    std::vector<char> buf(bufferSize(_SC_GETGR_R_SIZE_MAX));

    while(true)
    {
        group grp{};
        group* result = nullptr;

        int ret = getgrgid_r(gid, &grp, buf.data(), buf.size(), &result);
        if(ret == ERANGE)
        {
            buf.resize(buf.size() * 2);
            continue;
        }
        if(ret != 0)
        {
            errno = ret;
            sys_error("Could not look up group {}", gid);
            return {};
        }
        if(!result)
            return {};

        return GroupEntry{result->gr_name, result->gr_gid};
    }
}

std::optional<UserEntry> SystemDatabase::userByUID(uid_t uid) const
{
    std::vector<char> buf(bufferSize(_SC_GETPW_R_SIZE_MAX));

    while(true)
    {
        passwd pw{};
        passwd* result = nullptr;

        int ret = getpwuid_r(uid, &pw, buf.data(), buf.size(), &result);
        if(ret == ERANGE)
        {
            buf.resize(buf.size() * 2);
            continue;
        }
        if(ret != 0)
        {
            errno = ret;
            sys_error("Could not look up user {}", uid);
            return {};
        }
        if(!result)
            return {};

        UserEntry entry;
        entry.name = result->pw_name;
        entry.uid = result->pw_uid;
        entry.gid = result->pw_gid;
        if(result->pw_dir && result->pw_dir[0])
            entry.home = result->pw_dir;
        if(result->pw_shell && result->pw_shell[0])
            entry.shell = result->pw_shell;
        return entry;
    }
}

bool SystemDatabase::createGroup(gid_t gid, const std::string& name)
{
    auto gidString = std::to_string(gid);
    return os::run("groupadd", "-g", gidString.c_str(), name.c_str());
}

bool SystemDatabase::createUser(uid_t uid, gid_t gid, const std::string& name, const std::filesystem::path& shell)
{
    auto uidString = std::to_string(uid);
    auto gidString = std::to_string(gid);
    return os::run("useradd",
        "-u", uidString.c_str(),
        "-g", gidString.c_str(),
        "-m",
        "-s", shell.c_str(),
        name.c_str()
    );
}

Result provision(Database& db, const Request& request)
{
    Result result;
    result.identity.uid = request.uid;
    result.identity.gid = request.gid;

    if(auto group = db.groupByGID(request.gid))
    {
        debug("Group {} already exists as '{}'", request.gid, group->name);
        result.group = Outcome::Existing;
        result.identity.groupname = group->name;
    }
    else
    {
        info("Creating group '{}' with GID {}", request.groupName, request.gid);
        if(!db.createGroup(request.gid, request.groupName))
        {
            error("Could not create group '{}' with GID {}", request.groupName, request.gid);
            return result;
        }

        // Trust the database over our request, it might have been mangled
        auto created = db.groupByGID(request.gid);
        if(!created)
        {
            error("Group with GID {} does not exist after creating it", request.gid);
            return result;
        }

        result.group = Outcome::Created;
        result.identity.groupname = created->name;
    }

    std::optional<UserEntry> user = db.userByUID(request.uid);
    if(user)
    {
        debug("User {} already exists as '{}'", request.uid, user->name);
        result.user = Outcome::Existing;
    }
    else
    {
        info("Creating user '{}' with UID {}", request.userName, request.uid);
        if(!db.createUser(request.uid, request.gid, request.userName, request.shell))
        {
            error("Could not create user '{}' with UID {}", request.userName, request.uid);
            return result;
        }

        user = db.userByUID(request.uid);
        if(!user)
        {
            error("User with UID {} does not exist after creating it", request.uid);
            return result;
        }

        result.user = Outcome::Created;
    }

    result.identity.username = user->name;
    result.identity.home = user->home;

    return result;
}

}
