#pragma once

#include "hitlgate/config/schema.hpp"
#include "hitlgate/observability/observer.hpp"

#include <memory>
#include <string>

namespace hitlgate::observability {

/// `log`, `noop`/`none`, or a comma list of those. Unknown names fall back to `log`.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const std::string &backend);
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace hitlgate::observability
