#pragma once

#include "sandshell/observability/observer.hpp"

#include <iosfwd>
#include <optional>

namespace sandshell::observability {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view value);

/// Writes one "[LEVEL] message" line per event at or above `min_level`.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(LogLevel min_level, std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream *out_;
};

} // namespace sandshell::observability
