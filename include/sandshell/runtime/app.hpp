#pragma once

#include "sandshell/common/result.hpp"
#include "sandshell/config/schema.hpp"
#include "sandshell/sandbox/supervisor.hpp"
#include "sandshell/tools/builtin/sandboxed_shell.hpp"

#include <memory>

namespace sandshell::runtime {

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Installs the configured observer as the process-wide one.
  void install_observer() const;

  /// Builds the tool once validate_config() reports no hard errors.
  [[nodiscard]] common::Result<std::unique_ptr<tools::SandboxedShellTool>> create_shell_tool(
      std::shared_ptr<sandbox::IProcessRunner> runner =
          std::make_shared<sandbox::PosixProcessRunner>()) const;

private:
  config::Config config_;
};

} // namespace sandshell::runtime
