// Command line / environment configuration

#ifndef SETTINGS_H
#define SETTINGS_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "argparser.h"
#include "config.h"
#include "credentials.h"
#include "environment.h"
#include "identity.h"

namespace settings
{

struct Args
{
    argparser::Option<bool, {.shortName = 'h'}> help = false;
    bool version = false;
    argparser::Option<bool, {.shortName = 'v'}> verbose = false;
    bool print_config = false;

    argparser::Option<std::uint32_t, {.fromEnv = true}> uid = config::DEFAULT_UID;
    argparser::Option<std::uint32_t, {.fromEnv = true}> gid = config::DEFAULT_GID;
    std::string user_name = config::DEFAULT_USER_NAME;
    std::string group_name = config::DEFAULT_GROUP_NAME;
    std::string shell = config::DEFAULT_SHELL;

    argparser::Option<std::string, {.fromEnv = true}> workdir{config::DEFAULT_WORKDIR};
    std::string project = config::DEFAULT_PROJECT;

    argparser::Option<std::optional<std::string>, {.fromEnv = true}> home;
    std::optional<std::string> ssh_dir;

    argparser::PositionalArguments remaining;
};

//! Everything the bootstrap needs, resolved from Args and the environment
struct Settings
{
    identity::Request identity;

    std::filesystem::path workdir;
    std::string project;

    //! Explicit credentials directory, otherwise <home>/.ssh
    std::optional<std::filesystem::path> sshDir;
    //! Fallback home if the user entry has none
    std::optional<std::filesystem::path> home;

    std::vector<credentials::KeyInput> keys;

    std::vector<std::string> command;
};

/**
 * Parse environment-backed options, TINY_ENTRYPOINT_ARGS and finally
 * @p arguments (without argv[0]).
 * Throws argparser::ArgumentException.
 **/
Args parseArgs(const Environment& env, std::span<char*> arguments);

Settings resolve(const Args& args, const Environment& env);

//! Printable form of @p settings. Key values are reduced to set/unset.
nlohmann::json toJSON(const Settings& settings);

}

#endif
