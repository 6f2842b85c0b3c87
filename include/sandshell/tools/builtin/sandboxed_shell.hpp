#pragma once

#include "sandshell/sandbox/policy.hpp"
#include "sandshell/sandbox/supervisor.hpp"
#include "sandshell/tools/tool.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace sandshell::tools {

using AmbientProvider = std::function<sandbox::AmbientContext()>;

/// Runs a shell command under bwrap with the whole host tree read-only, no
/// network, private pid/ipc/cgroup namespaces and scratch tmpfs mounts.
/// The command text goes to the shell verbatim; the sandbox protects the
/// host, not the command from itself.
class SandboxedShellTool final : public ITool {
public:
  explicit SandboxedShellTool(
      sandbox::SandboxOptions options = {},
      std::shared_ptr<sandbox::IProcessRunner> runner =
          std::make_shared<sandbox::PosixProcessRunner>(),
      AmbientProvider ambient = sandbox::capture_ambient_context);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override;
  [[nodiscard]] std::uint32_t timeout_ms() const override;
  [[nodiscard]] std::string_view group() const override;

  /// Policy this tool would apply to a call made with `ctx`.
  [[nodiscard]] sandbox::SandboxPolicy policy_for(const ToolContext &ctx) const;

  /// Executes `command` and returns the normalized text. Never throws.
  [[nodiscard]] std::string run(std::string_view command, const ToolContext &ctx = {}) const;

  [[nodiscard]] const sandbox::SandboxOptions &options() const { return options_; }

private:
  [[nodiscard]] sandbox::ExecutionOutcome run_outcome(std::string_view command,
                                                      const ToolContext &ctx) const;

  sandbox::SandboxOptions options_;
  sandbox::SandboxSupervisor supervisor_;
  AmbientProvider ambient_;
};

/// Host-facing entry point: default hardened options, ambient context captured
/// at call time, output text always returned.
[[nodiscard]] std::string sandboxed_shell(std::string_view command);

} // namespace sandshell::tools
