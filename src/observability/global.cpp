#include "sandshell/observability/global.hpp"

#include <mutex>

namespace sandshell::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_sandbox_launch(const std::string &front_end, const std::size_t command_bytes,
                           const bool drop_capabilities) {
  record_event(SandboxLaunchEvent{.front_end = front_end,
                                  .command_bytes = command_bytes,
                                  .drop_capabilities = drop_capabilities});
}

void record_sandbox_outcome(const std::string &kind, std::optional<int> exit_code,
                            std::chrono::milliseconds duration) {
  record_event(SandboxOutcomeEvent{.kind = kind, .exit_code = exit_code, .duration = duration});
  record_metric(ExecutionLatencyMetric{.latency = duration});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace sandshell::observability
