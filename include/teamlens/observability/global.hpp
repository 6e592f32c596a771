#pragma once

#include "teamlens/observability/observer.hpp"

#include <memory>

namespace teamlens::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_file_ingested(const std::string &team, const std::string &kind,
                          const std::string &path, std::chrono::milliseconds duration);
void record_parse_failure(const std::string &path, const std::string &reason);
void record_session_started(const std::string &team, std::int64_t session_id,
                            std::int64_t created_at);
void record_session_ended(const std::string &team, std::int64_t session_id);
void record_observer_connected(std::uint64_t client_id, const std::string &remote);
void record_observer_disconnected(std::uint64_t client_id, const std::string &reason);
void record_heartbeat_tick();
void record_error(const std::string &component, const std::string &message);
void record_queue_depth(const std::string &queue, std::uint64_t depth);
void record_connected_observers(std::uint64_t count);

} // namespace teamlens::observability
