// Built-in defaults

#ifndef CONFIG_H
#define CONFIG_H

#include <cstdint>

namespace config
{
    constexpr std::uint32_t DEFAULT_UID = 1000;
    constexpr std::uint32_t DEFAULT_GID = 1000;

    // Names used when we have to create the group/user ourselves
    constexpr auto DEFAULT_USER_NAME = "mcp";
    constexpr auto DEFAULT_GROUP_NAME = "mcp";
    constexpr auto DEFAULT_SHELL = "/bin/bash";

    constexpr auto DEFAULT_WORKDIR = "/home/mcp/workspace";
    constexpr auto DEFAULT_PROJECT = "default";

    constexpr auto SSH_DIR_NAME = ".ssh";

    // Extra command line options, split like a shell would
    constexpr auto ARGS_VARIABLE = "TINY_ENTRYPOINT_ARGS";
}

#endif
