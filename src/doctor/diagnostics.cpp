#include "sandshell/doctor/diagnostics.hpp"

#include "sandshell/common/fs.hpp"
#include "sandshell/config/config.hpp"
#include "sandshell/sandbox/outcome.hpp"
#include "sandshell/tools/builtin/sandboxed_shell.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace sandshell::doctor {

namespace {

constexpr std::chrono::seconds kSmokeTimeout{10};

void add_check(DiagnosticsReport &report, DiagnosticCheck check) {
  switch (check.status) {
  case CheckStatus::Pass:
    ++report.passed;
    break;
  case CheckStatus::Fail:
    ++report.failed;
    break;
  case CheckStatus::Warn:
    ++report.warnings;
    break;
  }
  report.checks.push_back(std::move(check));
}

DiagnosticCheck check_config(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Config";
  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    check.status = CheckStatus::Fail;
    check.message = validation.error();
    return check;
  }

  if (!validation.value().empty()) {
    check.status = CheckStatus::Warn;
    check.message = validation.value().front();
    return check;
  }

  check.status = CheckStatus::Pass;
  check.message = "valid";
  return check;
}

DiagnosticCheck check_front_end(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "bwrap";
  const char *path = std::getenv("PATH");
  auto found = common::find_executable(config.sandbox.bwrap_path,
                                       path != nullptr ? path : config.sandbox.fallback_path);
  if (!found.ok()) {
    check.status = CheckStatus::Fail;
    check.message = found.error() + " (install bubblewrap: apt-get install bubblewrap)";
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = found.value().string();
  return check;
}

DiagnosticCheck check_capabilities(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Capabilities";
  if (config.sandbox.drop_capabilities) {
    check.status = CheckStatus::Pass;
    check.message = "all dropped";
  } else {
    check.status = CheckStatus::Warn;
    check.message = "kept (sandbox.drop_capabilities = false)";
  }
  return check;
}

DiagnosticCheck check_smoke_run(const config::Config &config,
                                std::shared_ptr<sandbox::IProcessRunner> runner) {
  DiagnosticCheck check;
  check.name = "Sandbox";

  auto options = config.sandbox;
  options.timeout = std::min(options.timeout, kSmokeTimeout);
  tools::SandboxedShellTool tool(options, std::move(runner));

  const auto start = std::chrono::steady_clock::now();
  const auto result = tool.execute({{"command", "true"}}, tools::ToolContext{});
  check.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  if (!result.ok()) {
    check.status = CheckStatus::Fail;
    check.message = result.error();
  } else if (!result.value().success) {
    check.status = CheckStatus::Fail;
    check.message = result.value().output;
  } else {
    check.status = CheckStatus::Pass;
    check.message = "namespaces available";
  }
  return check;
}

} // namespace

DiagnosticsReport run_diagnostics(const config::Config &config,
                                  std::shared_ptr<sandbox::IProcessRunner> runner) {
  DiagnosticsReport report;

  add_check(report, check_config(config));
  add_check(report, check_front_end(config));
  add_check(report, check_capabilities(config));
  add_check(report, check_smoke_run(config, std::move(runner)));
  return report;
}

void print_diagnostics_report(const DiagnosticsReport &report) {
  auto status_prefix = [](CheckStatus status) -> const char * {
    switch (status) {
    case CheckStatus::Pass:
      return "[PASS]";
    case CheckStatus::Fail:
      return "[FAIL]";
    case CheckStatus::Warn:
      return "[WARN]";
    }
    return "[INFO]";
  };

  for (const auto &check : report.checks) {
    std::cout << status_prefix(check.status) << " " << check.name << ": " << check.message;
    if (check.latency.has_value()) {
      std::cout << " (" << check.latency->count() << "ms)";
    }
    std::cout << "\n";
  }

  std::cout << "Summary: " << report.passed << " passed, " << report.failed << " failed, "
            << report.warnings << " warnings\n";
}

} // namespace sandshell::doctor
