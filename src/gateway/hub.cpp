#include "teamlens/gateway/hub.hpp"

#include "teamlens/common/fs.hpp"
#include "teamlens/gateway/protocol.hpp"
#include "teamlens/health/health.hpp"
#include "teamlens/observability/global.hpp"

#include <algorithm>
#include <iostream>

namespace teamlens::gateway {

namespace {

constexpr const char *COMPONENT = "broadcast";

} // namespace

BroadcastHub::BroadcastHub(const state::StateAggregator &aggregator,
                           sessions::SessionStore *store, HubOptions options)
    : aggregator_(aggregator), store_(store), options_(options) {}

BroadcastHub::~BroadcastHub() { stop(); }

common::Status BroadcastHub::start(WebSocketOptions transport) {
  if (running_) {
    return common::Status::success();
  }
  health::mark_component_starting(COMPONENT);

  transport.on_open = [this](const std::uint64_t id, const std::string &remote) {
    handle_open(id, remote);
  };
  transport.on_message = [this](const std::uint64_t id, const std::string &text) {
    handle_message(id, text);
  };
  transport.on_close = [this](const std::uint64_t id, const std::string &reason) {
    handle_close(id, reason);
  };

  auto status = server_.start(transport);
  if (!status.ok()) {
    health::mark_component_error(COMPONENT, status.error());
    return status;
  }

  running_ = true;
  heartbeat_thread_ = std::thread([this]() { heartbeat_loop(); });
  std::cerr << "[broadcast] listening host=" << transport.host << " port=" << server_.port()
            << (transport.tls_enabled ? " tls=on" : "") << "\n";
  health::mark_component_ok(COMPONENT, "port=" + std::to_string(server_.port()));
  return common::Status::success();
}

void BroadcastHub::stop() {
  const bool was_running = running_.exchange(false);
  if (heartbeat_thread_.joinable()) {
    heartbeat_thread_.join();
  }
  server_.stop();
  {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.clear();
  }
  if (was_running) {
    health::mark_component_stopped(COMPONENT);
  }
}

bool BroadcastHub::is_running() const { return running_; }

std::uint16_t BroadcastHub::port() const { return server_.port(); }

std::size_t BroadcastHub::observer_count() const {
  std::lock_guard<std::mutex> lock(observers_mutex_);
  return observers_.size();
}

void BroadcastHub::on_change(const state::TeamChange &change) {
  if (!running_) {
    return;
  }
  (void)server_.broadcast(encode_team_update(change, common::now_epoch_ms()));
}

std::size_t BroadcastHub::send_heartbeat() {
  const auto observers = observer_count();
  observability::record_heartbeat_tick();
  observability::record_connected_observers(observers);
  health::mark_component_ok(COMPONENT, "observers=" + std::to_string(observers));
  return server_.broadcast(encode_heartbeat(observers, common::now_epoch_ms()));
}

void BroadcastHub::handle_open(const std::uint64_t client_id, const std::string &remote) {
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_[client_id] = "";
    count = observers_.size();
  }
  observability::record_observer_connected(client_id, remote);
  observability::record_connected_observers(count);
  send_snapshot(client_id);
}

void BroadcastHub::handle_message(const std::uint64_t client_id, const std::string &text) {
  const auto request = parse_client_message(text);
  if (!request.ok()) {
    (void)server_.send(client_id, encode_error(request.error(), common::now_epoch_ms()));
    return;
  }

  switch (request.value().kind) {
  case ClientRequestKind::SwitchTeam: {
    {
      std::lock_guard<std::mutex> lock(observers_mutex_);
      observers_[client_id] = request.value().team;
    }
    send_snapshot(client_id);
    return;
  }
  case ClientRequestKind::GetHistory: {
    if (store_ == nullptr) {
      (void)server_.send(client_id, encode_error("history unavailable", common::now_epoch_ms()));
      return;
    }
    const auto sessions = store_->list_sessions();
    if (!sessions.ok()) {
      (void)server_.send(client_id, encode_error(sessions.error(), common::now_epoch_ms()));
      return;
    }
    (void)server_.send(client_id, encode_history(sessions.value(), common::now_epoch_ms()));
    return;
  }
  case ClientRequestKind::GetSession: {
    if (store_ == nullptr) {
      (void)server_.send(client_id, encode_error("history unavailable", common::now_epoch_ms()));
      return;
    }
    const auto detail = store_->get_session(request.value().session_id);
    if (!detail.ok()) {
      (void)server_.send(client_id, encode_error(detail.error(), common::now_epoch_ms()));
      return;
    }
    (void)server_.send(client_id, encode_session(detail.value(), common::now_epoch_ms()));
    return;
  }
  }
}

void BroadcastHub::handle_close(const std::uint64_t client_id, const std::string &reason) {
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(client_id);
    count = observers_.size();
  }
  observability::record_observer_disconnected(client_id, reason);
  observability::record_connected_observers(count);
}

void BroadcastHub::send_snapshot(const std::uint64_t client_id) {
  std::string active_team;
  {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    const auto it = observers_.find(client_id);
    if (it == observers_.end()) {
      return;
    }
    active_team = it->second;
  }
  (void)server_.send(client_id,
                     encode_snapshot(*aggregator_.snapshot(), active_team, common::now_epoch_ms()));
}

void BroadcastHub::heartbeat_loop() {
  const auto wait_steps =
      std::max<long long>(1, std::chrono::milliseconds(options_.heartbeat_interval).count() / 100);
  while (running_) {
    for (long long i = 0; i < wait_steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (!running_) {
      break;
    }
    (void)send_heartbeat();
  }
}

} // namespace teamlens::gateway
