#include "unisrv/observability/global.hpp"

#include <mutex>

namespace unisrv::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_phase(const std::string &phase, const std::string &detail) {
  record_event(RolloutPhaseEvent{.phase = phase, .detail = detail});
}

void record_replica(const std::size_t index, const std::string &instance_id,
                    const std::string &stage) {
  record_event(ReplicaEvent{.index = index, .instance_id = instance_id, .stage = stage});
}

void record_boot_progress(const std::string &instance_id, const std::string &phase,
                          const std::string &line) {
  record_event(BootProgressEvent{.instance_id = instance_id, .phase = phase, .line = line});
}

void record_debug(const std::string &component, const std::string &message) {
  record_event(DebugEvent{.component = component, .message = message});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_request_latency(const std::string &operation, const std::chrono::milliseconds latency) {
  record_metric(RequestLatencyMetric{.operation = operation, .latency = latency});
}

} // namespace unisrv::observability
