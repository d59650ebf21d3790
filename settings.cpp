// Command line / environment configuration

#include "settings.h"

#include <wordexp.h>

#include "log.h"
#include "scope_guard.h"

namespace settings
{

Args parseArgs(const Environment& env, std::span<char*> arguments)
{
    Args args;
    argparser::Parser parser{args};

    parser.parseEnvironment(env);

    // Additional arguments from environment variable
    if(auto extra = env.value(config::ARGS_VARIABLE))
    {
        std::string expanded{*extra};
        wordexp_t words{};
        auto guard = sg::make_scope_guard([&]{ wordfree(&words); });

        if(auto ret = wordexp(expanded.c_str(), &words, WRDE_SHOWERR | WRDE_NOCMD))
        {
            switch(ret)
            {
                case WRDE_BADCHAR:
                    throw argparser::ArgumentException{fmt::format("Invalid character in {}", config::ARGS_VARIABLE)};
                case WRDE_BADVAL:
                    throw argparser::ArgumentException{fmt::format("Undefined env variable in {}", config::ARGS_VARIABLE)};
                case WRDE_CMDSUB:
                    throw argparser::ArgumentException{fmt::format("Command substitution is not allowed in {}", config::ARGS_VARIABLE)};
                case WRDE_NOSPACE:
                    throw argparser::ArgumentException{"Out of memory"};
                case WRDE_SYNTAX:
                    throw argparser::ArgumentException{fmt::format("Syntax error in {}", config::ARGS_VARIABLE)};
            }
            throw argparser::ArgumentException{"Unknown wordexp() error"};
        }

        parser.parse(std::span<char*>(words.we_wordv, words.we_wordc));
    }

    parser.parse(arguments);

    return args;
}

Settings resolve(const Args& args, const Environment& env)
{
    Settings settings;

    settings.identity.uid = args.uid;
    settings.identity.gid = args.gid;
    settings.identity.userName = args.user_name;
    settings.identity.groupName = args.group_name;
    settings.identity.shell = args.shell;

    settings.workdir = args.workdir.value();
    settings.project = args.project;

    if(args.ssh_dir)
        settings.sshDir = *args.ssh_dir;
    if(args.home.value())
        settings.home = *args.home.value();

    for(const auto& slot : credentials::KEY_SLOTS)
    {
        auto value = env.value(slot.variable);
        settings.keys.push_back({slot, value ? std::string{*value} : std::string{}});
    }

    settings.command.assign(args.remaining.begin(), args.remaining.end());

    return settings;
}

nlohmann::json toJSON(const Settings& settings)
{
    using json = nlohmann::json;

    json keys = json::array();
    for(const auto& key : settings.keys)
    {
        keys.push_back({
            {"variable", std::string{key.slot.variable}},
            {"file", std::string{key.slot.fileName}},
            {"label", std::string{key.slot.label}},
            {"set", !key.encoded.empty()}
        });
    }

    json out = {
        {"uid", settings.identity.uid},
        {"gid", settings.identity.gid},
        {"user_name", settings.identity.userName},
        {"group_name", settings.identity.groupName},
        {"shell", settings.identity.shell.string()},
        {"workdir", settings.workdir.string()},
        {"project", settings.project},
        {"keys", keys},
        {"command", settings.command}
    };

    out["ssh_dir"] = settings.sshDir ? json(settings.sshDir->string()) : json(nullptr);
    out["home"] = settings.home ? json(settings.home->string()) : json(nullptr);

    return out;
}

}
