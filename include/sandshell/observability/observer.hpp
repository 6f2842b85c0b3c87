#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sandshell::observability {

struct SandboxLaunchEvent {
  std::string front_end;
  std::size_t command_bytes = 0;
  bool drop_capabilities = false;
};

struct SandboxOutcomeEvent {
  std::string kind;
  std::optional<int> exit_code;
  std::chrono::milliseconds duration{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SandboxLaunchEvent, SandboxOutcomeEvent, ErrorEvent>;

struct ExecutionLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct OutputBytesMetric {
  std::uint64_t bytes = 0;
};

using ObserverMetric = std::variant<ExecutionLatencyMetric, OutputBytesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sandshell::observability
