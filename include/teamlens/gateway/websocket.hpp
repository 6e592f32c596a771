#pragma once

#include "teamlens/common/result.hpp"

#include <openssl/ssl.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace teamlens::gateway {

struct WebSocketOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 0;
  std::size_t max_clients = 256;
  std::size_t max_queued_messages = 1024;
  bool tls_enabled = false;
  std::string tls_cert_file;
  std::string tls_key_file;
  // Invoked from the client's reader thread.
  std::function<void(std::uint64_t client_id, const std::string &remote)> on_open;
  std::function<void(std::uint64_t client_id, const std::string &text)> on_message;
  std::function<void(std::uint64_t client_id, const std::string &reason)> on_close;
};

class WebSocketServer {
public:
  WebSocketServer();
  ~WebSocketServer();

  WebSocketServer(const WebSocketServer &) = delete;
  WebSocketServer &operator=(const WebSocketServer &) = delete;

  [[nodiscard]] common::Status start(const WebSocketOptions &options);
  void stop();

  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] std::size_t connected_clients() const;

  // A full queue disconnects the client.
  bool send(std::uint64_t client_id, const std::string &text);
  std::size_t broadcast(const std::string &text);
  void disconnect(std::uint64_t client_id, const std::string &reason);

private:
  struct OutboundFrame {
    std::uint8_t opcode = 0x1u;
    std::string payload;
  };

  struct ClientState {
    std::uint64_t id = 0;
    int fd = -1;
    SSL *ssl = nullptr;
    std::string remote;
    std::atomic<bool> open{false};
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<OutboundFrame> outbox;
    bool closing = false;

    ~ClientState();
  };

  void accept_loop();
  void client_loop(std::shared_ptr<ClientState> client);
  void writer_loop(std::shared_ptr<ClientState> client);
  [[nodiscard]] bool perform_handshake(const std::shared_ptr<ClientState> &client) const;
  bool enqueue(const std::shared_ptr<ClientState> &client, OutboundFrame frame);
  void remove_client(std::uint64_t client_id, const std::string &reason);
  void spawn(std::function<void()> body);

  WebSocketOptions options_;
  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;
  SSL_CTX *tls_ctx_ = nullptr;
  std::atomic<std::uint64_t> next_client_id_{1};

  mutable std::mutex clients_mutex_;
  std::unordered_map<std::uint64_t, std::shared_ptr<ClientState>> clients_;

  std::mutex threads_mutex_;
  std::condition_variable threads_cv_;
  std::size_t active_threads_ = 0;
};

} // namespace teamlens::gateway
