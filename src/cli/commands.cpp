#include "sandshell/cli/commands.hpp"

#include "sandshell/common/fs.hpp"
#include "sandshell/config/config.hpp"
#include "sandshell/doctor/diagnostics.hpp"
#include "sandshell/runtime/app.hpp"
#include "sandshell/sandbox/policy.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <chrono>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace sandshell::cli {

namespace {

std::string version_string() {
#ifdef SANDSHELL_VERSION
  std::string version = SANDSHELL_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef SANDSHELL_GIT_COMMIT
  const std::string commit = SANDSHELL_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "sandshell " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    // Everything after "--" belongs to the sandboxed command.
    if (args[i] == "--") {
      break;
    }
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

std::optional<std::chrono::seconds> parse_timeout_secs(const std::string &raw) {
  std::uint64_t value = 0;
  const auto *end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(raw.data(), end, value);
  if (ec != std::errc() || ptr != end || value == 0 ||
      value > static_cast<std::uint64_t>(sandbox::kMaxTimeout.count())) {
    return std::nullopt;
  }
  return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(value));
}

struct CommandRequest {
  std::string command;
  std::optional<std::chrono::seconds> timeout;
  std::optional<std::string> cwd;
  bool keep_capabilities = false;
};

// Parses "[--timeout SECS] [--no-cap-drop] [--cwd DIR] (-c CMD | -- CMD... | -)".
bool parse_command_request(std::vector<std::string> args, CommandRequest &request,
                           std::string &error) {
  std::vector<std::string> trailing;
  if (const auto separator = std::find(args.begin(), args.end(), "--"); separator != args.end()) {
    trailing.assign(separator + 1, args.end());
    args.erase(separator, args.end());
  }

  std::string value;
  if (take_option(args, "--timeout", "-t", value)) {
    request.timeout = parse_timeout_secs(value);
    if (!request.timeout.has_value()) {
      error = "invalid --timeout value: " + value;
      return false;
    }
  }
  if (take_option(args, "--cwd", "", value)) {
    request.cwd = value;
  }
  request.keep_capabilities = take_flag(args, "--no-cap-drop");

  bool have_command = false;
  if (take_option(args, "--command", "-c", value)) {
    request.command = value;
    have_command = true;
  }
  if (take_flag(args, "-")) {
    if (have_command) {
      error = "use only one of -c, - or --";
      return false;
    }
    request.command = read_stdin_all();
    have_command = true;
  }

  if (!args.empty()) {
    error = "unexpected argument: " + args.front();
    return false;
  }
  if (!trailing.empty()) {
    if (have_command) {
      error = "use only one of -c, - or --";
      return false;
    }
    request.command = join_tokens(trailing);
    have_command = true;
  }
  if (!have_command) {
    error = "missing command (use -c CMD, -- CMD... or - to read stdin)";
    return false;
  }
  return true;
}

common::Result<runtime::RuntimeContext> load_runtime(const CommandRequest &request) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return context;
  }
  auto &sandbox = context.value().mutable_config().sandbox;
  if (request.timeout.has_value()) {
    sandbox.timeout = *request.timeout;
  }
  if (request.keep_capabilities) {
    sandbox.drop_capabilities = false;
  }
  context.value().install_observer();
  return context;
}

tools::ToolContext tool_context(const CommandRequest &request) {
  tools::ToolContext ctx;
  if (request.cwd.has_value()) {
    ctx.working_directory = *request.cwd;
  }
  return ctx;
}

int run_command(std::vector<std::string> args) {
  CommandRequest request;
  std::string error;
  if (!parse_command_request(std::move(args), request, error)) {
    std::cerr << error << "\n";
    std::cerr << "usage: sandshell run [--timeout SECS] [--no-cap-drop] [--cwd DIR] "
                 "(-c CMD | -- CMD... | -)\n";
    return 1;
  }

  auto context = load_runtime(request);
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto tool = context.value().create_shell_tool();
  if (!tool.ok()) {
    std::cerr << "invalid config: " << tool.error() << "\n";
    return 1;
  }

  std::cout << tool.value()->run(request.command, tool_context(request)) << "\n";
  return 0;
}

int run_policy(std::vector<std::string> args) {
  CommandRequest request;
  std::string error;
  if (!parse_command_request(std::move(args), request, error)) {
    std::cerr << error << "\n";
    std::cerr << "usage: sandshell policy [--timeout SECS] [--no-cap-drop] [--cwd DIR] "
                 "(-c CMD | -- CMD... | -)\n";
    return 1;
  }

  auto context = load_runtime(request);
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto tool = context.value().create_shell_tool();
  if (!tool.ok()) {
    std::cerr << "invalid config: " << tool.error() << "\n";
    return 1;
  }

  const auto policy = tool.value()->policy_for(tool_context(request));
  for (const auto &token : sandbox::build_bwrap_args(policy, request.command)) {
    std::cout << token << "\n";
  }
  return 0;
}

int run_doctor() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << "[FAIL] Config load: " << context.error() << "\n";
    return 1;
  }
  context.value().install_observer();

  const auto report = doctor::run_diagnostics(context.value().config());
  doctor::print_diagnostics_report(report);
  return report.failed == 0 ? 0 : 1;
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args[0] == "show") {
    auto cfg = config::load_config();
    if (!cfg.ok()) {
      std::cerr << cfg.error() << "\n";
      return 1;
    }
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (args[0] == "init") {
    args.erase(args.begin());
    const bool force = take_flag(args, "--force");
    if (config::config_exists() && !force) {
      std::cerr << "config already exists (use --force to overwrite)\n";
      return 1;
    }
    if (auto saved = config::save_config(config::Config{}); !saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    auto path = config::config_path();
    if (path.ok()) {
      std::cout << "Wrote " << path.value().string() << "\n";
    }
    return 0;
  }

  std::cerr << "usage: sandshell config [show|init [--force]]\n";
  return 1;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  sandshell" << RESET << DIM
            << "  shell commands in a read-only, offline bubblewrap sandbox" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "sandshell [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  EXECUTION" << RESET << "\n";
  std::cout << "  " << GREEN << "run" << RESET << " -- CMD" << DIM
            << "     Run CMD in the sandbox (-c CMD, or - for stdin)" << RESET << "\n";
  std::cout << "  " << GREEN << "policy" << RESET << " -- CMD" << DIM
            << "  Print the bwrap argv without running it" << RESET << "\n";
  std::cout << DIM << "  options: --timeout SECS  --no-cap-drop  --cwd DIR" << RESET << "\n\n";

  std::cout << BOLD << "  DIAGNOSTICS" << RESET << "\n";
  std::cout << "  " << GREEN << "doctor" << RESET << DIM << "         Check bwrap and namespaces"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM
            << "    Display effective configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config init" << RESET << DIM
            << "    Write a default config file" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Print config file location"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET
            << "\n\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_command(std::move(args));
  }
  if (subcommand == "policy") {
    return run_policy(std::move(args));
  }
  if (subcommand == "doctor") {
    return run_doctor();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace sandshell::cli
