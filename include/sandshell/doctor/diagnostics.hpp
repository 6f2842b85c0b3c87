#pragma once

#include "sandshell/config/schema.hpp"
#include "sandshell/sandbox/supervisor.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sandshell::doctor {

enum class CheckStatus {
  Pass,
  Fail,
  Warn,
};

struct DiagnosticCheck {
  std::string name;
  CheckStatus status = CheckStatus::Pass;
  std::string message;
  std::optional<std::chrono::milliseconds> latency;
};

struct DiagnosticsReport {
  std::vector<DiagnosticCheck> checks;
  int passed = 0;
  int failed = 0;
  int warnings = 0;
};

/// Config validity, bwrap lookup, capability dropping and a live `true` run.
[[nodiscard]] DiagnosticsReport run_diagnostics(
    const config::Config &config,
    std::shared_ptr<sandbox::IProcessRunner> runner =
        std::make_shared<sandbox::PosixProcessRunner>());
void print_diagnostics_report(const DiagnosticsReport &report);

} // namespace sandshell::doctor
