// Container startup sequence: identity, workspace, SSH keys, handoff

#ifndef BOOTSTRAP_H
#define BOOTSTRAP_H

#include "handoff.h"
#include "identity.h"
#include "settings.h"

namespace bootstrap
{

/**
 * Run the whole startup sequence and hand over to the target command.
 *
 * Returns the exit status for the bootstrap process: 1 if anything fatal
 * happened before the handoff (the target command never ran). With the real
 * ExecHandoff a successful run does not return at all.
 **/
[[nodiscard]]
int run(const settings::Settings& settings, identity::Database& db, handoff::Handoff& handoff);

}

#endif
