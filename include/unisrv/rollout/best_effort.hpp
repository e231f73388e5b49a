#pragma once

#include "unisrv/common/result.hpp"
#include "unisrv/observability/global.hpp"

#include <string>
#include <utility>
#include <vector>

namespace unisrv::rollout {

/// Runs cleanup steps that must not stop at the first failure. Each failure
/// is logged as a warning and kept for the final report.
class BestEffort {
public:
  explicit BestEffort(std::string component) : component_(std::move(component)) {}

  template <typename Fn> void run(const std::string &what, Fn &&fn) {
    const common::Status status = std::forward<Fn>(fn)();
    if (status.ok()) {
      return;
    }
    std::string message = "Failed to " + what + ": " + status.error();
    observability::record_warning(component_, message);
    failures_.push_back(std::move(message));
  }

  [[nodiscard]] const std::vector<std::string> &failures() const { return failures_; }
  [[nodiscard]] bool clean() const { return failures_.empty(); }

private:
  std::string component_;
  std::vector<std::string> failures_;
};

} // namespace unisrv::rollout
