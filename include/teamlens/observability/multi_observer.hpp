#pragma once

#include "teamlens/observability/observer.hpp"

#include <memory>
#include <vector>

namespace teamlens::observability {

// Fans out to every child. A child that throws is reported and skipped for
// that call; the others still receive it.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  template <typename Call> void forward(const char *what, Call &&call);

  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace teamlens::observability
