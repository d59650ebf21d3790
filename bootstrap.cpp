// Container startup sequence: identity, workspace, SSH keys, handoff

#include "bootstrap.h"

#include <algorithm>

#include <fmt/std.h>

#include "config.h"
#include "credentials.h"
#include "log.h"
#include "workspace.h"

namespace fs = std::filesystem;

namespace bootstrap
{

int run(const settings::Settings& settings, identity::Database& db, handoff::Handoff& handoff)
{
    info("Starting with UID: {}, GID: {}", settings.identity.uid, settings.identity.gid);

    auto provisioned = identity::provision(db, settings.identity);
    if(!provisioned.ok())
    {
        error("Could not provision identity {}:{}", settings.identity.uid, settings.identity.gid);
        return 1;
    }
    const auto& user = provisioned.identity;

    debug("Running as user '{}' ({}), group '{}' ({}), home {}",
        user.username, user.uid, user.groupname, user.gid, user.home);

    if(workspace::provision(settings.workdir, settings.project, user) == workspace::Result::Failed)
    {
        error("Could not set up workspace {}", settings.workdir);
        return 1;
    }

    fs::path sshDir;
    if(settings.sshDir)
        sshDir = *settings.sshDir;
    else if(!user.home.empty())
        sshDir = user.home / config::SSH_DIR_NAME;
    else if(settings.home)
        sshDir = *settings.home / config::SSH_DIR_NAME;
    else
    {
        error("User '{}' has no home directory and HOME is not set, cannot place SSH keys", user.username);
        return 1;
    }

    auto results = credentials::materializeAll(sshDir, settings.keys, user);
    if(std::ranges::find(results, credentials::Result::Failed) != results.end())
    {
        error("SSH key setup failed");
        return 1;
    }

    // The application serves its projects from WORKDIR
    handoff::Variables variables{{"WORKDIR", settings.workdir.string()}};

    if(!handoff.become(user, settings.command, variables))
        return 1;

    return 0;
}

}
