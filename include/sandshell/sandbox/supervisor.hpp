#pragma once

#include "sandshell/sandbox/outcome.hpp"
#include "sandshell/sandbox/policy.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sandshell::sandbox {

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  /// Runs argv[0] (looked up in PATH) with argv, capturing stdout and stderr.
  /// Never throws; every failure is reported through the outcome.
  [[nodiscard]] virtual ExecutionOutcome run(const std::vector<std::string> &argv,
                                             std::chrono::milliseconds timeout) = 0;
};

/// fork/exec runner. The child gets its own process group and /dev/null as
/// stdin; on timeout the whole group is killed and reaped before returning.
class PosixProcessRunner final : public IProcessRunner {
public:
  [[nodiscard]] ExecutionOutcome run(const std::vector<std::string> &argv,
                                     std::chrono::milliseconds timeout) override;
};

class SandboxSupervisor {
public:
  explicit SandboxSupervisor(
      std::shared_ptr<IProcessRunner> runner = std::make_shared<PosixProcessRunner>());

  /// Launches the isolation front-end for `command` once under `policy`.
  [[nodiscard]] ExecutionOutcome execute(const SandboxPolicy &policy,
                                         std::string_view command) const;

private:
  std::shared_ptr<IProcessRunner> runner_;
};

} // namespace sandshell::sandbox
