#pragma once

#include "sandshell/observability/observer.hpp"

#include <memory>

namespace sandshell::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_sandbox_launch(const std::string &front_end, std::size_t command_bytes,
                           bool drop_capabilities);
void record_sandbox_outcome(const std::string &kind, std::optional<int> exit_code,
                            std::chrono::milliseconds duration);
void record_error(const std::string &component, const std::string &message);

} // namespace sandshell::observability
