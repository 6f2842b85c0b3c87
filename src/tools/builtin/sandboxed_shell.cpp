#include "sandshell/tools/builtin/sandboxed_shell.hpp"

#include "sandshell/observability/global.hpp"
#include "sandshell/sandbox/outcome.hpp"

#include <algorithm>
#include <exception>
#include <limits>

namespace sandshell::tools {

namespace {

common::Result<std::string> required_arg(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  if (it == args.end()) {
    return common::Result<std::string>::failure("Missing argument: " + name);
  }
  return common::Result<std::string>::success(it->second);
}

} // namespace

SandboxedShellTool::SandboxedShellTool(sandbox::SandboxOptions options,
                                       std::shared_ptr<sandbox::IProcessRunner> runner,
                                       AmbientProvider ambient)
    : options_(std::move(options)), supervisor_(std::move(runner)), ambient_(std::move(ambient)) {}

std::string_view SandboxedShellTool::name() const { return "sandboxed_shell"; }

std::string_view SandboxedShellTool::description() const {
  return "Execute a shell command in a bubblewrap sandbox. The host filesystem is visible "
         "read-only, there is no network, and /tmp, /var and /run are empty scratch space "
         "discarded after the call. Pipes and other /bin/sh syntax work. Returns stdout, a "
         "[stderr] section and the exit code when non-zero.";
}

std::string SandboxedShellTool::parameters_schema() const {
  return R"({"type":"object","required":["command"],"properties":{"command":{"type":"string","description":"Shell command to run, e.g. \"ls -la\" or \"grep -r pattern /path\""}}})";
}

sandbox::SandboxPolicy SandboxedShellTool::policy_for(const ToolContext &ctx) const {
  sandbox::AmbientContext ambient = ambient_ ? ambient_() : sandbox::AmbientContext{};
  if (ctx.working_directory.has_value() && !ctx.working_directory->empty()) {
    ambient.cwd = ctx.working_directory->string();
  }
  return sandbox::build_policy(options_, ambient);
}

sandbox::ExecutionOutcome SandboxedShellTool::run_outcome(std::string_view command,
                                                          const ToolContext &ctx) const {
  try {
    return supervisor_.execute(policy_for(ctx), command);
  } catch (const std::exception &ex) {
    observability::record_error("sandboxed_shell", ex.what());
    return sandbox::LaunchFailedOutcome{.message = ex.what()};
  }
}

std::string SandboxedShellTool::run(std::string_view command, const ToolContext &ctx) const {
  return sandbox::format_outcome(run_outcome(command, ctx));
}

common::Result<ToolResult> SandboxedShellTool::execute(const ToolArgs &args,
                                                       const ToolContext &ctx) {
  auto command = required_arg(args, "command");
  if (!command.ok()) {
    return common::Result<ToolResult>::failure(command.error());
  }

  const auto outcome = run_outcome(command.value(), ctx);

  ToolResult result;
  result.output = sandbox::format_outcome(outcome);
  result.metadata["outcome"] = std::string(sandbox::outcome_kind(outcome));
  if (const auto *completed = std::get_if<sandbox::CompletedOutcome>(&outcome);
      completed != nullptr) {
    result.success = completed->exit_code == 0;
    result.metadata["exit_code"] = std::to_string(completed->exit_code);
  } else {
    result.success = false;
  }
  return common::Result<ToolResult>::success(std::move(result));
}

bool SandboxedShellTool::is_safe() const { return true; }

std::uint32_t SandboxedShellTool::timeout_ms() const {
  // Same clamp build_policy applies, so the product cannot overflow.
  const auto timeout = std::clamp(options_.timeout, std::chrono::seconds::zero(),
                                  sandbox::kMaxTimeout);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
  return static_cast<std::uint32_t>(
      std::min<std::chrono::milliseconds::rep>(ms, std::numeric_limits<std::uint32_t>::max()));
}

std::string_view SandboxedShellTool::group() const { return "runtime"; }

std::string sandboxed_shell(std::string_view command) {
  const SandboxedShellTool tool;
  return tool.run(command);
}

} // namespace sandshell::tools
