#pragma once

#include "unisrv/config/schema.hpp"
#include "unisrv/observability/observer.hpp"

#include <memory>

namespace unisrv::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace unisrv::observability
