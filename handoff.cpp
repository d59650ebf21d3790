// Handing the process over to the target command

#include "handoff.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <grp.h>
#include <sys/capability.h>
#include <unistd.h>

#include <fmt/ranges.h>
#include <fmt/std.h>

#include "config.h"
#include "log.h"
#include "os.h"

namespace fs = std::filesystem;

namespace handoff
{

namespace
{
    [[nodiscard]]
    bool drop_privileges(const identity::RuntimeIdentity& identity)
    {
        if(getuid() == identity.uid && geteuid() == identity.uid
            && getgid() == identity.gid && getegid() == identity.gid)
        {
            debug("Already running as {}:{}, not changing identity", identity.uid, identity.gid);
            return true;
        }

        if(!os::has_capability(CAP_SETUID) || !os::has_capability(CAP_SETGID))
        {
            error("Cannot switch from {}:{} to {}:{}: missing CAP_SETUID/CAP_SETGID",
                geteuid(), getegid(), identity.uid, identity.gid);
            return false;
        }

        if(!identity.username.empty())
        {
            if(initgroups(identity.username.c_str(), identity.gid) != 0)
            {
                sys_error("Could not set supplementary groups of '{}'", identity.username);
                return false;
            }
        }
        else
        {
            gid_t gid = identity.gid;
            if(setgroups(1, &gid) != 0)
            {
                sys_error("Could not set supplementary groups");
                return false;
            }
        }

        if(setgid(identity.gid) != 0)
        {
            sys_error("Could not setgid({})", identity.gid);
            return false;
        }

        if(setuid(identity.uid) != 0)
        {
            sys_error("Could not setuid({})", identity.uid);
            return false;
        }

        if(identity.uid != 0)
        {
            if(setuid(0) == 0)
            {
                error("Privilege drop failed: could switch back to root");
                return false;
            }

            if(!os::capabilities_cleared())
            {
                error("Privilege drop failed: process still holds capabilities");
                return false;
            }
        }

        debug("Now running as {}:{}", getuid(), getgid());
        return true;
    }
}

bool ExecHandoff::become(const identity::RuntimeIdentity& identity, const std::vector<std::string>& argv,
    const Variables& variables)
{
    std::vector<std::string> command = argv;
    if(command.empty())
        command.push_back(config::DEFAULT_SHELL);

    fs::path binary = command.front();
    if(command.front().find('/') == std::string::npos)
    {
        auto found = os::find_binary(command.front());
        if(!found)
        {
            error("Could not find {} in PATH", command.front());
            return false;
        }
        binary = *found;
    }

    if(!drop_privileges(identity))
        return false;

    Variables environment = variables;
    if(!identity.home.empty())
        environment.insert_or_assign("HOME", identity.home.string());
    if(!identity.username.empty())
        environment.insert_or_assign("USER", identity.username);

    for(const auto& [name, value] : environment)
    {
        if(setenv(name.c_str(), value.c_str(), 1) != 0)
        {
            sys_error("Could not set {}", name);
            return false;
        }
    }

    std::vector<char*> execArgs;
    for(auto& arg : command)
        execArgs.push_back(strdup(arg.c_str()));
    execArgs.push_back(nullptr);

    debug("Running {} as {}:{}", command, identity.uid, identity.gid);
    execv(binary.c_str(), execArgs.data());

    sys_error("Could not execute {}", binary);
    for(auto arg : execArgs)
        free(arg);
    return false;
}

}
