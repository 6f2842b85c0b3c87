#pragma once

namespace sandshell::cli {

/// Entry point shared by main() and the CLI tests. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace sandshell::cli
