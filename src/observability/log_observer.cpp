#include "sandshell/observability/log_observer.hpp"

#include "sandshell/common/fs.hpp"

#include <iostream>
#include <mutex>
#include <type_traits>

namespace sandshell::observability {

namespace {

std::mutex g_log_mutex;

std::string_view level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

std::optional<LogLevel> parse_log_level(std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

LogObserver::LogObserver(const LogLevel min_level) : min_level_(min_level), out_(&std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(g_log_mutex);
  *out_ << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SandboxLaunchEvent>) {
          log_line(LogLevel::Debug, "sandbox.launch front_end=" + evt.front_end +
                                        " command_bytes=" + std::to_string(evt.command_bytes) +
                                        " cap_drop=" + (evt.drop_capabilities ? "all" : "none"));
        } else if constexpr (std::is_same_v<T, SandboxOutcomeEvent>) {
          std::string line = "sandbox.outcome kind=" + evt.kind;
          if (evt.exit_code.has_value()) {
            line += " exit_code=" + std::to_string(*evt.exit_code);
          }
          line += " duration_ms=" + std::to_string(evt.duration.count());
          log_line(evt.kind == "completed" ? LogLevel::Info : LogLevel::Warn, line);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExecutionLatencyMetric>) {
          log_line(LogLevel::Debug,
                   "metric.execution_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, OutputBytesMetric>) {
          log_line(LogLevel::Debug, "metric.output_bytes=" + std::to_string(m.bytes));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  out_->flush();
}

} // namespace sandshell::observability
