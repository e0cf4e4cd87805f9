#pragma once

#include "hostwarden/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hostwarden::observability {

/// Fans events out to every backend. An empty chain discards everything, which is how
/// logging.backend = "none" is represented.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return name_; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
  std::string name_ = "none";
};

} // namespace hostwarden::observability
