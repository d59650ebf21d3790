// Container entrypoint: set up identity, workspace & SSH keys, then exec

#include <span>

#include <fmt/format.h>

#include "argparser.h"
#include "bootstrap.h"
#include "environment.h"
#include "handoff.h"
#include "identity.h"
#include "log.h"
#include "settings.h"

void usage() {
  fmt::print(R"EOS(
Usage: tiny_entrypoint [options] [cmd to execute...]

Prepares the container and then replaces itself with cmd, running as the
configured user. Without cmd, /bin/bash is started.

Options:
  --help                   This help screen.
  --version                Print version information.
  --verbose                Enable verbose messages.
  --print-config           Print the resolved configuration as JSON and exit.
  --uid UID                Run as UID (env: UID, default 1000).
  --gid GID                Run as GID (env: GID, default 1000).
  --user-name NAME         Name for the user if it has to be created.
  --group-name NAME        Name for the group if it has to be created.
  --shell PATH             Login shell for a created user.
  --workdir PATH           Workspace root (env: WORKDIR).
  --project NAME           Default project directory inside the workspace.
  --home PATH              Fallback home directory (env: HOME).
  --ssh-dir PATH           Place SSH keys here instead of ~/.ssh.

SSH private keys are read base64-encoded from SSH_PRIVATE_KEY_RSA_B64,
SSH_PRIVATE_KEY_ECDSA_B64 and SSH_PRIVATE_KEY_ED25519_B64. Existing key
files are never overwritten.

Additional options can be passed in TINY_ENTRYPOINT_ARGS.

)EOS");
}

int main(int argc, char **argv) {
  log_init();

  auto env = Environment::fromProcess();

  settings::Args args;
  try {
    args = settings::parseArgs(env, std::span<char *>(argv + 1, argc > 0 ? argc - 1 : 0));
  } catch (argparser::ArgumentException &e) {
    error("Could not parse arguments: {}", e.what());
    error("See --help for help.");
    return 1;
  }

  if (args.help) {
    usage();
    return 0;
  }

  if (args.version) {
    fmt::print("{}.{}.{}\n", VERSION_MAJOR, VERSION_MINOR, VERSION_PATCH);
    return 0;
  }

  // Logging
  log_debug = args.verbose;

  auto resolved = settings::resolve(args, env);

  if (args.print_config) {
    fmt::print("{}\n", settings::toJSON(resolved).dump(2));
    return 0;
  }

  identity::SystemDatabase db;
  handoff::ExecHandoff handoff;

  return bootstrap::run(resolved, db, handoff);
}
