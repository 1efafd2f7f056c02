#pragma once

#include "linkwatch/config/schema.hpp"
#include "linkwatch/observability/observer.hpp"

#include <memory>

namespace linkwatch::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Settings &settings);

} // namespace linkwatch::observability
