#include "unisrv/observability/factory.hpp"

#include "unisrv/common/fs.hpp"
#include "unisrv/observability/log_observer.hpp"
#include "unisrv/observability/observers.hpp"

namespace unisrv::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend, const LogLevel level) {
  if (backend == "log") {
    return std::make_unique<LogObserver>(level);
  }
  return std::make_unique<NoopObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  const LogLevel level = parse_log_level(config.observability.level);
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') == std::string::npos) {
    return create_single(backend, level);
  }

  auto multi = std::make_unique<MultiObserver>();
  bool has_log = false;
  for (const auto &part : common::split(backend, ',')) {
    const std::string name = common::trim(part);
    if (name == "log" && !has_log) {
      multi->add(create_single(name, level));
      has_log = true;
    }
  }
  return multi;
}

} // namespace unisrv::observability
