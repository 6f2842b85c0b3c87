#pragma once

#include "sandshell/config/schema.hpp"
#include "sandshell/observability/observer.hpp"

#include <memory>

namespace sandshell::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace sandshell::observability
