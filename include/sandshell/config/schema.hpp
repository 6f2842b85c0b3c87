#pragma once

#include "sandshell/sandbox/policy.hpp"

#include <string>

namespace sandshell::config {

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "warn";
};

struct Config {
  sandbox::SandboxOptions sandbox;
  ObservabilityConfig observability;
};

} // namespace sandshell::config
