#pragma once

#include "unisrv/observability/observer.hpp"

#include <memory>

namespace unisrv::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_phase(const std::string &phase, const std::string &detail = "");
void record_replica(std::size_t index, const std::string &instance_id, const std::string &stage);
void record_boot_progress(const std::string &instance_id, const std::string &phase,
                          const std::string &line);
void record_debug(const std::string &component, const std::string &message);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);
void record_request_latency(const std::string &operation, std::chrono::milliseconds latency);

} // namespace unisrv::observability
