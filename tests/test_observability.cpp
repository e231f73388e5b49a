#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "unisrv/observability/factory.hpp"
#include "unisrv/observability/global.hpp"
#include "unisrv/observability/log_observer.hpp"
#include "unisrv/observability/observers.hpp"

#include <sstream>

namespace {

namespace obs = unisrv::observability;

/// Installs a capturing observer for the lifetime of the guard.
class CaptureGuard {
public:
  CaptureGuard() {
    auto observer = std::make_unique<obs::CapturingObserver>();
    capture_ = observer.get();
    obs::set_global_observer(std::move(observer));
  }
  ~CaptureGuard() { obs::set_global_observer(nullptr); }

  CaptureGuard(const CaptureGuard &) = delete;
  CaptureGuard &operator=(const CaptureGuard &) = delete;

  [[nodiscard]] const obs::CapturingObserver &capture() const { return *capture_; }

private:
  obs::CapturingObserver *capture_ = nullptr;
};

} // namespace

void register_observability_tests(std::vector<unisrv::tests::TestCase> &tests) {
  using unisrv::tests::require;

  tests.push_back({"log_level_parsing", [] {
                     require(obs::parse_log_level("DEBUG") == obs::LogLevel::Debug, "debug");
                     require(obs::parse_log_level(" warning ") == obs::LogLevel::Warn, "warning");
                     require(obs::parse_log_level("error") == obs::LogLevel::Error, "error");
                     require(obs::parse_log_level("verbose") == obs::LogLevel::Info, "fallback");
                     require(obs::log_level_label(obs::LogLevel::Warn) == "WARN", "label");
                   }});

  tests.push_back({"log_observer_filters_below_level", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(obs::LogLevel::Info, out);
                     observer.record_event(obs::DebugEvent{.component = "api", .message = "hidden"});
                     observer.record_event(
                         obs::RolloutPhaseEvent{.phase = "resolving", .detail = "service web"});
                     observer.record_event(
                         obs::WarningEvent{.component = "rollout", .message = "slow stop"});
                     observer.record_event(obs::BootProgressEvent{
                         .instance_id = "c0ffee00", .phase = "Pulling container image", .line = "x"});
                     observer.flush();
                     require(out.str() ==
                                 "[INFO] resolving: service web\n[WARN] rollout: slow stop\n",
                             out.str());
                   }});

  tests.push_back({"log_observer_debug_shows_boot_and_metrics", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(obs::LogLevel::Debug, out);
                     observer.record_event(obs::BootProgressEvent{
                         .instance_id = "c0ffee00", .phase = "Executing container", .line = "ready"});
                     observer.record_event(obs::ReplicaEvent{
                         .index = 1, .instance_id = "c0ffee00", .stage = "healthy"});
                     observer.record_metric(obs::RequestLatencyMetric{
                         .operation = "GET /services", .latency = std::chrono::milliseconds(42)});
                     const std::string text = out.str();
                     require(text.find("[DEBUG] c0ffee00 [Executing container] ready") !=
                                 std::string::npos,
                             text);
                     require(text.find("[INFO] replica 1 healthy (c0ffee00)") != std::string::npos,
                             text);
                     require(text.find("op=GET /services 42") != std::string::npos, text);
                   }});

  tests.push_back({"observer_factory_backends", [] {
                     auto config = unisrv::testing::mock_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none");
                     config.observability.backend = " LOG ";
                     require(obs::create_observer(config)->name() == "log", "log");
                     config.observability.backend = "statsd";
                     require(obs::create_observer(config)->name() == "noop", "unknown backend");
                     config.observability.backend = "log, log, statsd";
                     const auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list");
                     require(static_cast<const obs::MultiObserver &>(*multi).size() == 1,
                             "log added once");
                   }});

  tests.push_back({"global_observer_receives_helpers", [] {
                     CaptureGuard guard;
                     obs::record_phase("provisioning_replica", "1/2");
                     obs::record_replica(0, "c0ffee00", "created");
                     obs::record_warning("rollout", "Failed to stop instance");
                     const auto phases = guard.capture().events_of<obs::RolloutPhaseEvent>();
                     require(phases.size() == 1 && phases[0].detail == "1/2", "phase event");
                     require(guard.capture().events_of<obs::ReplicaEvent>().size() == 1, "replica");
                     const auto warnings = guard.capture().events_of<obs::WarningEvent>();
                     require(warnings.size() == 1 && warnings[0].component == "rollout", "warning");
                     require(guard.capture().events().size() == 3, "three events");
                   }});

  tests.push_back({"global_observer_absent_is_silent", [] {
                     obs::set_global_observer(nullptr);
                     obs::record_error("api", "nobody listens");
                     require(obs::get_global_observer() == nullptr, "no observer");
                   }});
}
