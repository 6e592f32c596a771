#pragma once

#include "teamlens/config/schema.hpp"
#include "teamlens/observability/observer.hpp"

#include <memory>

namespace teamlens::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace teamlens::observability
