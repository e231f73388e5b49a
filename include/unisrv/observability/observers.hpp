#pragma once

#include "unisrv/observability/observer.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace unisrv::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

/// Fans every event out to each child in insertion order.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer) {
    if (observer != nullptr) {
      observers_.push_back(std::move(observer));
    }
  }

  void record_event(const ObserverEvent &event) override {
    for (auto &observer : observers_) {
      observer->record_event(event);
    }
  }

  void record_metric(const ObserverMetric &metric) override {
    for (auto &observer : observers_) {
      observer->record_metric(metric);
    }
  }

  void flush() override {
    for (auto &observer : observers_) {
      observer->flush();
    }
  }

  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

/// Keeps every event in memory; used to inspect what a run reported.
class CapturingObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }

  void record_metric(const ObserverMetric &metric) override {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.push_back(metric);
  }

  [[nodiscard]] std::vector<ObserverEvent> events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  template <typename T> [[nodiscard]] std::vector<T> events_of() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> out;
    for (const auto &event : events_) {
      if (const auto *typed = std::get_if<T>(&event); typed != nullptr) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  [[nodiscard]] std::string_view name() const override { return "capture"; }

private:
  mutable std::mutex mutex_;
  std::vector<ObserverEvent> events_;
  std::vector<ObserverMetric> metrics_;
};

} // namespace unisrv::observability
