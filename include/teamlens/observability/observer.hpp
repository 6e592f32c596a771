#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace teamlens::observability {

struct FileIngestedEvent {
  std::string team;
  std::string kind;
  std::string path;
  std::chrono::milliseconds duration{0};
};

struct ParseFailureEvent {
  std::string path;
  std::string reason;
};

struct SessionStartedEvent {
  std::string team;
  std::int64_t session_id = 0;
  std::int64_t created_at = 0;
};

struct SessionEndedEvent {
  std::string team;
  std::int64_t session_id = 0;
};

struct ObserverConnectedEvent {
  std::uint64_t client_id = 0;
  std::string remote;
};

struct ObserverDisconnectedEvent {
  std::uint64_t client_id = 0;
  std::string reason;
};

struct HeartbeatTickEvent {};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<FileIngestedEvent, ParseFailureEvent, SessionStartedEvent, SessionEndedEvent,
                 ObserverConnectedEvent, ObserverDisconnectedEvent, HeartbeatTickEvent,
                 ErrorEvent>;

struct QueueDepthMetric {
  std::string queue;
  std::uint64_t depth = 0;
};

struct ConnectedObserversMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<QueueDepthMetric, ConnectedObserversMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace teamlens::observability
