#pragma once

#include "hostwarden/config/schema.hpp"
#include "hostwarden/observability/observer.hpp"

#include <memory>

namespace hostwarden::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace hostwarden::observability
