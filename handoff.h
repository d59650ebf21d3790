// Handing the process over to the target command

#ifndef HANDOFF_H
#define HANDOFF_H

#include <map>
#include <string>
#include <vector>

#include "identity.h"

namespace handoff
{

//! Extra environment variables for the target command
using Variables = std::map<std::string, std::string>;

class Handoff
{
public:
    virtual ~Handoff() = default;

    /**
     * Become @p argv running as @p identity, with @p variables added to
     * the environment.
     *
     * Returns only if that was not possible, after logging the reason.
     * Nothing of the target command has run in that case.
     **/
    [[nodiscard]]
    virtual bool become(const identity::RuntimeIdentity& identity, const std::vector<std::string>& argv,
        const Variables& variables) = 0;
};

//! Drop privileges and execv() the command
class ExecHandoff : public Handoff
{
public:
    bool become(const identity::RuntimeIdentity& identity, const std::vector<std::string>& argv,
        const Variables& variables) override;
};

}

#endif
