#include "teamlens/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace teamlens::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, FileIngestedEvent>) {
          log_line("DEBUG", "file.ingested team=" + evt.team + " kind=" + evt.kind +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ParseFailureEvent>) {
          log_line("WARN", "file.parse_failed path=" + evt.path + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, SessionStartedEvent>) {
          log_line("INFO", "session.start team=" + evt.team +
                               " id=" + std::to_string(evt.session_id) +
                               " created_at=" + std::to_string(evt.created_at));
        } else if constexpr (std::is_same_v<T, SessionEndedEvent>) {
          log_line("INFO",
                   "session.end team=" + evt.team + " id=" + std::to_string(evt.session_id));
        } else if constexpr (std::is_same_v<T, ObserverConnectedEvent>) {
          log_line("INFO", "observer.connect id=" + std::to_string(evt.client_id) +
                               " remote=" + evt.remote);
        } else if constexpr (std::is_same_v<T, ObserverDisconnectedEvent>) {
          log_line("INFO", "observer.disconnect id=" + std::to_string(evt.client_id) +
                               " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, HeartbeatTickEvent>) {
          log_line("DEBUG", "heartbeat.tick");
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          log_line("DEBUG", "metric.queue_depth queue=" + m.queue +
                                " depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, ConnectedObserversMetric>) {
          log_line("DEBUG", "metric.connected_observers=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace teamlens::observability
