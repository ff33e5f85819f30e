#pragma once

#include "cortex/config/schema.hpp"
#include "cortex/observability/observer.hpp"

#include <memory>

namespace cortex::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace cortex::observability
