#include "sandshell/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // A closed stdout must not kill us before the sandbox is reaped.
  std::signal(SIGPIPE, SIG_IGN);
  return sandshell::cli::run_cli(argc, argv);
}
