// Workspace provisioning

#ifndef WORKSPACE_H
#define WORKSPACE_H

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <sys/stat.h>

#include "identity.h"

namespace workspace
{

enum class Result
{
    Created,      //!< first boot: created and handed over to the identity
    Existing,     //!< already there, writable, left alone
    NotWritable,  //!< already there, but the identity cannot write to it
    Failed
};

/**
 * Make sure @p root / @p project exists.
 *
 * If the project directory is missing, it is created (together with
 * @p root) and the whole of @p root is chowned to the identity.
 * If it exists, ownership is never touched. Only write access is checked.
 **/
[[nodiscard]]
Result provision(const std::filesystem::path& root, const std::string& project, const identity::RuntimeIdentity& identity);

/**
 * Would @p identity be allowed to write into a directory with @p st?
 *
 * @p groups are the supplementary groups of the identity. The group bits
 * apply if the directory's group is the primary one or among them.
 **/
[[nodiscard]]
bool identityCanWrite(const struct stat& st, const identity::RuntimeIdentity& identity,
    std::span<const gid_t> groups = {});

//! Supplementary groups of @p identity according to the group database
std::vector<gid_t> supplementaryGroups(const identity::RuntimeIdentity& identity);

//! Is @p path on a read-only mount? std::nullopt if that cannot be determined.
std::optional<bool> onReadOnlyMount(const std::filesystem::path& path);

}

#endif
