#include "teamlens/observability/multi_observer.hpp"

#include <exception>
#include <iostream>

namespace teamlens::observability {

template <typename Call> void MultiObserver::forward(const char *what, Call &&call) {
  for (const auto &observer : observers_) {
    try {
      call(*observer);
    } catch (const std::exception &err) {
      std::cerr << "[observability] " << what << "_failed observer=" << observer->name() << " "
                << err.what() << "\n";
    }
  }
}

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return;
  }
  observers_.push_back(std::move(observer));
}

void MultiObserver::record_event(const ObserverEvent &event) {
  forward("event", [&event](IObserver &observer) { observer.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  forward("metric", [&metric](IObserver &observer) { observer.record_metric(metric); });
}

void MultiObserver::flush() {
  forward("flush", [](IObserver &observer) { observer.flush(); });
}

} // namespace teamlens::observability
