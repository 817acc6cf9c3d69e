#pragma once

#include "snapseek/config/schema.hpp"
#include "snapseek/observability/observer.hpp"

#include <memory>

namespace snapseek::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace snapseek::observability
