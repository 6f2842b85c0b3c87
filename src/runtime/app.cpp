#include "sandshell/runtime/app.hpp"

#include "sandshell/config/config.hpp"
#include "sandshell/observability/factory.hpp"
#include "sandshell/observability/global.hpp"

namespace sandshell::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
}

common::Result<std::unique_ptr<tools::SandboxedShellTool>>
RuntimeContext::create_shell_tool(std::shared_ptr<sandbox::IProcessRunner> runner) const {
  const auto validation = config::validate_config(config_);
  if (!validation.ok()) {
    return common::Result<std::unique_ptr<tools::SandboxedShellTool>>::failure(
        validation.error());
  }
  return common::Result<std::unique_ptr<tools::SandboxedShellTool>>::success(
      std::make_unique<tools::SandboxedShellTool>(config_.sandbox, std::move(runner)));
}

} // namespace sandshell::runtime
