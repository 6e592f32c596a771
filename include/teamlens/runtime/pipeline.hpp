#pragma once

#include "teamlens/common/result.hpp"
#include "teamlens/config/schema.hpp"
#include "teamlens/gateway/hub.hpp"
#include "teamlens/sessions/recorder.hpp"
#include "teamlens/sessions/store.hpp"
#include "teamlens/state/aggregator.hpp"
#include "teamlens/watch/file_watcher.hpp"

#include <chrono>
#include <memory>

namespace teamlens::runtime {

// disk -> watcher -> aggregator -> {recorder -> store, hub} -> observers
class Pipeline {
public:
  explicit Pipeline(config::Config config);
  ~Pipeline();

  Pipeline(const Pipeline &) = delete;
  Pipeline &operator=(const Pipeline &) = delete;

  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] state::StateAggregator &aggregator() { return *aggregator_; }
  [[nodiscard]] sessions::SessionStore &store() { return *store_; }
  [[nodiscard]] gateway::BroadcastHub &hub() { return *hub_; }

  [[nodiscard]] bool wait_idle(std::chrono::milliseconds timeout) const;

private:
  config::Config config_;
  std::unique_ptr<sessions::SessionStore> store_;
  std::unique_ptr<state::StateAggregator> aggregator_;
  std::unique_ptr<sessions::SessionRecorder> recorder_;
  std::unique_ptr<gateway::BroadcastHub> hub_;
  std::unique_ptr<watch::FileWatcher> watcher_;
  bool running_ = false;
};

} // namespace teamlens::runtime
