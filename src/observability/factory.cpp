#include "sandshell/observability/factory.hpp"

#include "sandshell/common/fs.hpp"
#include "sandshell/observability/log_observer.hpp"
#include "sandshell/observability/noop_observer.hpp"

namespace sandshell::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  const LogLevel level = parse_log_level(config.observability.level).value_or(LogLevel::Warn);
  return std::make_unique<LogObserver>(level);
}

} // namespace sandshell::observability
