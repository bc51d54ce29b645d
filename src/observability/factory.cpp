#include "hitlgate/observability/factory.hpp"

#include "hitlgate/common/fs.hpp"
#include "hitlgate/observability/log_observer.hpp"
#include "hitlgate/observability/multi_observer.hpp"

namespace hitlgate::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &name) {
  if (name.empty() || name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized.find(',') == std::string::npos) {
    return create_single(normalized);
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &part : common::split(normalized, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty()) {
      multi->add(create_single(name));
    }
  }
  return multi;
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  return create_observer(config.observability.backend);
}

} // namespace hitlgate::observability
