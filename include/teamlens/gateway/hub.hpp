#pragma once

#include "teamlens/gateway/websocket.hpp"
#include "teamlens/sessions/store.hpp"
#include "teamlens/state/aggregator.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace teamlens::gateway {

struct HubOptions {
  std::chrono::seconds heartbeat_interval{5};
};

class BroadcastHub final : public state::ChangeSink {
public:
  BroadcastHub(const state::StateAggregator &aggregator, sessions::SessionStore *store,
               HubOptions options = {});
  ~BroadcastHub() override;

  BroadcastHub(const BroadcastHub &) = delete;
  BroadcastHub &operator=(const BroadcastHub &) = delete;

  [[nodiscard]] common::Status start(WebSocketOptions transport);
  void stop();
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] std::size_t observer_count() const;

  void on_change(const state::TeamChange &change) override;
  std::size_t send_heartbeat();

private:
  void handle_open(std::uint64_t client_id, const std::string &remote);
  void handle_message(std::uint64_t client_id, const std::string &text);
  void handle_close(std::uint64_t client_id, const std::string &reason);
  void send_snapshot(std::uint64_t client_id);
  void heartbeat_loop();

  const state::StateAggregator &aggregator_;
  sessions::SessionStore *store_;
  HubOptions options_;
  WebSocketServer server_;

  mutable std::mutex observers_mutex_;
  // Observer id -> team it asked to view (empty until switch_team).
  std::unordered_map<std::uint64_t, std::string> observers_;

  std::thread heartbeat_thread_;
  std::atomic<bool> running_{false};
};

} // namespace teamlens::gateway
