// Snapshot of the process environment

#include "environment.h"

#include <unistd.h>

Environment::Environment(std::map<std::string, std::string, std::less<>> variables)
 : m_variables{std::move(variables)}
{
}

Environment Environment::fromProcess()
{
    Environment env;

    for(char** entry = environ; entry && *entry; ++entry)
    {
        std::string_view var{*entry};
        auto eq = var.find('=');
        if(eq == var.npos)
            continue;

        env.m_variables.emplace(var.substr(0, eq), var.substr(eq + 1));
    }

    return env;
}

std::optional<std::string_view> Environment::value(std::string_view name) const
{
    auto it = m_variables.find(name);
    if(it == m_variables.end() || it->second.empty())
        return {};

    return std::string_view{it->second};
}
