// Identity provisioning: make sure a group and user exist for our uid/gid

#ifndef IDENTITY_H
#define IDENTITY_H

#include <filesystem>
#include <optional>
#include <string>

#include <sys/types.h>

#include "config.h"

namespace identity
{

struct RuntimeIdentity
{
    uid_t uid = config::DEFAULT_UID;
    gid_t gid = config::DEFAULT_GID;
    std::string username;
    std::string groupname;
    std::filesystem::path home;
};

struct GroupEntry
{
    std::string name;
    gid_t gid = 0;
};

struct UserEntry
{
    std::string name;
    uid_t uid = 0;
    gid_t gid = 0;
    std::filesystem::path home;
    std::filesystem::path shell;
};

/**
 * Access to the system user/group database.
 *
 * Lookups return an empty optional if no entry exists. Creation methods
 * log their own diagnostics and return false on failure.
 **/
class Database
{
public:
    virtual ~Database() = default;

    virtual std::optional<GroupEntry> groupByGID(gid_t gid) const = 0;
    virtual std::optional<UserEntry> userByUID(uid_t uid) const = 0;

    [[nodiscard]]
    virtual bool createGroup(gid_t gid, const std::string& name) = 0;

    [[nodiscard]]
    virtual bool createUser(uid_t uid, gid_t gid, const std::string& name, const std::filesystem::path& shell) = 0;
};

//! /etc/passwd & /etc/group through NSS, groupadd/useradd for creation
class SystemDatabase : public Database
{
public:
    std::optional<GroupEntry> groupByGID(gid_t gid) const override;
    std::optional<UserEntry> userByUID(uid_t uid) const override;

    bool createGroup(gid_t gid, const std::string& name) override;
    bool createUser(uid_t uid, gid_t gid, const std::string& name, const std::filesystem::path& shell) override;
};

enum class Outcome
{
    Created,
    Existing,
    Failed
};

struct Request
{
    uid_t uid = config::DEFAULT_UID;
    gid_t gid = config::DEFAULT_GID;
    std::string userName = config::DEFAULT_USER_NAME;
    std::string groupName = config::DEFAULT_GROUP_NAME;
    std::filesystem::path shell = config::DEFAULT_SHELL;
};

struct Result
{
    Outcome group = Outcome::Failed;
    Outcome user = Outcome::Failed;

    //! Valid if neither group nor user failed
    RuntimeIdentity identity;

    bool ok() const
    { return group != Outcome::Failed && user != Outcome::Failed; }
};

/**
 * Ensure a group with the requested gid and a user with the requested uid
 * exist. Existing entries are left untouched, whatever their names.
 **/
[[nodiscard]]
Result provision(Database& db, const Request& request);

}

#endif
