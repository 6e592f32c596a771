#include "teamlens/runtime/pipeline.hpp"

#include <iostream>

namespace teamlens::runtime {

Pipeline::Pipeline(config::Config config) : config_(std::move(config)) {
  store_ = std::make_unique<sessions::SessionStore>(config_.store.db_path,
                                                    config_.store.busy_timeout_ms);
  aggregator_ = std::make_unique<state::StateAggregator>();
  recorder_ = std::make_unique<sessions::SessionRecorder>(*store_);
  hub_ = std::make_unique<gateway::BroadcastHub>(
      *aggregator_, store_.get(),
      gateway::HubOptions{.heartbeat_interval =
                              std::chrono::seconds(config_.broadcast.heartbeat_secs)});
  aggregator_->add_sink(recorder_.get());
  aggregator_->add_sink(hub_.get());
  watcher_ = std::make_unique<watch::FileWatcher>(
      watch::FileWatcherOptions{.teams_root = config_.watch.teams_dir,
                                .tasks_root = config_.watch.tasks_dir,
                                .debounce = std::chrono::milliseconds(config_.watch.debounce_ms)},
      [this](const watch::ClassifiedChange &change) { aggregator_->enqueue(change); });
}

Pipeline::~Pipeline() { stop(); }

common::Status Pipeline::start() {
  if (running_) {
    return common::Status::success();
  }

  auto status = store_->open();
  if (!status.ok()) {
    return status.with_context("store");
  }
  recorder_->start();
  aggregator_->start();

  gateway::WebSocketOptions transport;
  transport.host = config_.broadcast.host;
  transport.port = config_.broadcast.port;
  transport.max_clients = config_.broadcast.max_clients;
  transport.max_queued_messages = config_.broadcast.max_queued_messages;
  transport.tls_enabled = config_.broadcast.tls_enabled;
  transport.tls_cert_file = config_.broadcast.tls_cert_file;
  transport.tls_key_file = config_.broadcast.tls_key_file;
  status = hub_->start(transport);
  if (!status.ok()) {
    aggregator_->stop();
    recorder_->stop();
    store_->close();
    return status.with_context("broadcast");
  }

  status = watcher_->start();
  if (!status.ok()) {
    hub_->stop();
    aggregator_->stop();
    recorder_->stop();
    store_->close();
    return status.with_context("watcher");
  }

  running_ = true;
  std::cerr << "[pipeline] running teams=" << config_.watch.teams_dir
            << " tasks=" << config_.watch.tasks_dir << " db=" << config_.store.db_path << "\n";
  return common::Status::success();
}

void Pipeline::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  watcher_->stop();
  aggregator_->stop();
  recorder_->stop();
  store_->close();
  hub_->stop();
  std::cerr << "[pipeline] stopped\n";
}

bool Pipeline::is_running() const { return running_; }

std::uint16_t Pipeline::port() const { return hub_->port(); }

bool Pipeline::wait_idle(const std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  // Recorder work can enqueue nothing new, but the aggregator can feed the
  // recorder, so check both twice.
  for (int round = 0; round < 2; ++round) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0 || !aggregator_->wait_idle(remaining)) {
      return false;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0 || !recorder_->wait_idle(left)) {
      return false;
    }
  }
  return true;
}

} // namespace teamlens::runtime
