#include "teamlens/observability/global.hpp"

#include <mutex>

namespace teamlens::observability {

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

void record_file_ingested(const std::string &team, const std::string &kind,
                          const std::string &path, const std::chrono::milliseconds duration) {
  record_event(
      FileIngestedEvent{.team = team, .kind = kind, .path = path, .duration = duration});
}

void record_parse_failure(const std::string &path, const std::string &reason) {
  record_event(ParseFailureEvent{.path = path, .reason = reason});
}

void record_session_started(const std::string &team, const std::int64_t session_id,
                            const std::int64_t created_at) {
  record_event(
      SessionStartedEvent{.team = team, .session_id = session_id, .created_at = created_at});
}

void record_session_ended(const std::string &team, const std::int64_t session_id) {
  record_event(SessionEndedEvent{.team = team, .session_id = session_id});
}

void record_observer_connected(const std::uint64_t client_id, const std::string &remote) {
  record_event(ObserverConnectedEvent{.client_id = client_id, .remote = remote});
}

void record_observer_disconnected(const std::uint64_t client_id, const std::string &reason) {
  record_event(ObserverDisconnectedEvent{.client_id = client_id, .reason = reason});
}

void record_heartbeat_tick() { record_event(HeartbeatTickEvent{}); }

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_queue_depth(const std::string &queue, const std::uint64_t depth) {
  record_metric(QueueDepthMetric{.queue = queue, .depth = depth});
}

void record_connected_observers(const std::uint64_t count) {
  record_metric(ConnectedObserversMetric{.count = count});
}

} // namespace teamlens::observability
