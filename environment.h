// Snapshot of the process environment

#ifndef ENVIRONMENT_H
#define ENVIRONMENT_H

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

class Environment
{
public:
    Environment() = default;
    explicit Environment(std::map<std::string, std::string, std::less<>> variables);

    static Environment fromProcess();

    /**
     * Value of @p name. Unset and empty variables are treated the same,
     * like ${NAME:-default} in a shell.
     **/
    [[nodiscard]]
    std::optional<std::string_view> value(std::string_view name) const;

private:
    std::map<std::string, std::string, std::less<>> m_variables;
};

#endif
