#pragma once

#include "chatfetch/config/schema.hpp"
#include "chatfetch/observability/observer.hpp"

#include <memory>

namespace chatfetch::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace chatfetch::observability
