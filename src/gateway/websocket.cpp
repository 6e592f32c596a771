#include "teamlens/gateway/websocket.hpp"

#include "teamlens/common/fs.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace teamlens::gateway {

namespace {

constexpr std::size_t kMaxHandshakeBytes = 8 * 1024;
constexpr std::size_t kMaxFramePayloadBytes = 1024 * 1024;
constexpr int kListenBacklog = 64;
constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr auto kStopGrace = std::chrono::seconds(5);

constexpr std::uint8_t kOpText = 0x1u;
constexpr std::uint8_t kOpClose = 0x8u;
constexpr std::uint8_t kOpPing = 0x9u;
constexpr std::uint8_t kOpPong = 0xAu;

ssize_t write_bytes(const int fd, SSL *ssl, const std::uint8_t *data, const std::size_t size) {
  if (ssl != nullptr) {
    return static_cast<ssize_t>(SSL_write(ssl, data, static_cast<int>(size)));
  }
  return ::send(fd, data, size, MSG_NOSIGNAL);
}

ssize_t read_bytes(const int fd, SSL *ssl, std::uint8_t *data, const std::size_t size) {
  if (ssl != nullptr) {
    return static_cast<ssize_t>(SSL_read(ssl, data, static_cast<int>(size)));
  }
  return ::recv(fd, data, size, 0);
}

bool send_all(const int fd, SSL *ssl, const std::uint8_t *data, std::size_t size) {
  std::size_t sent = 0;
  while (sent < size) {
    const ssize_t n = write_bytes(fd, ssl, data + sent, size - sent);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

bool recv_exact(const int fd, SSL *ssl, std::uint8_t *data, std::size_t size) {
  std::size_t received = 0;
  while (received < size) {
    const ssize_t n = read_bytes(fd, ssl, data + received, size - received);
    if (n <= 0) {
      return false;
    }
    received += static_cast<std::size_t>(n);
  }
  return true;
}

std::string lower_trimmed(const std::string &value) {
  return common::to_lower(common::trim(value));
}

std::string normalize_bind_host(const std::string &host) {
  const std::string lowered = lower_trimmed(host);
  if (lowered == "localhost" || lowered == "::1" || lowered == "[::1]") {
    return "127.0.0.1";
  }
  return common::trim(host);
}

std::unordered_map<std::string, std::string> parse_headers(const std::string &request) {
  std::unordered_map<std::string, std::string> headers;
  std::istringstream lines(request);
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    if (first) {
      headers[":request-line"] = line;
      first = false;
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    headers[lower_trimmed(line.substr(0, colon))] = common::trim(line.substr(colon + 1));
  }
  return headers;
}

std::string websocket_accept(const std::string &client_key) {
  const std::string source = client_key + std::string(kWebSocketGuid);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char *>(source.data()), source.size(), digest.data());

  const int output_len = 4 * static_cast<int>((digest.size() + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), digest.data(),
                  static_cast<int>(digest.size()));
  return output;
}

std::string openssl_error_string() {
  const auto code = ERR_get_error();
  if (code == 0) {
    return "unknown openssl error";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return std::string(buffer.data());
}

bool send_http_response(const int fd, SSL *ssl, const int status, const std::string &status_text,
                        const std::vector<std::pair<std::string, std::string>> &headers,
                        const std::string &body = "") {
  std::ostringstream response;
  response << "HTTP/1.1 " << status << " " << status_text << "\r\n";
  for (const auto &[k, v] : headers) {
    response << k << ": " << v << "\r\n";
  }
  if (status != 101) {
    response << "Content-Length: " << body.size() << "\r\n";
  }
  response << "\r\n";
  response << body;
  const std::string text = response.str();
  return send_all(fd, ssl, reinterpret_cast<const std::uint8_t *>(text.data()), text.size());
}

bool read_next_frame(const int fd, SSL *ssl, std::uint8_t &opcode, std::string &payload) {
  std::array<std::uint8_t, 2> header{};
  if (!recv_exact(fd, ssl, header.data(), header.size())) {
    return false;
  }

  const bool fin = (header[0] & 0x80u) != 0;
  opcode = static_cast<std::uint8_t>(header[0] & 0x0Fu);
  const bool masked = (header[1] & 0x80u) != 0;
  std::uint64_t payload_len = static_cast<std::uint64_t>(header[1] & 0x7Fu);

  if (!fin) {
    return false;
  }

  if (payload_len == 126u) {
    std::array<std::uint8_t, 2> ext{};
    if (!recv_exact(fd, ssl, ext.data(), ext.size())) {
      return false;
    }
    payload_len = (static_cast<std::uint64_t>(ext[0]) << 8u) | static_cast<std::uint64_t>(ext[1]);
  } else if (payload_len == 127u) {
    std::array<std::uint8_t, 8> ext{};
    if (!recv_exact(fd, ssl, ext.data(), ext.size())) {
      return false;
    }
    payload_len = 0;
    for (const auto byte : ext) {
      payload_len = (payload_len << 8u) | static_cast<std::uint64_t>(byte);
    }
  }

  // Clients must mask (RFC 6455 5.1).
  if (!masked || payload_len > kMaxFramePayloadBytes ||
      payload_len > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
    return false;
  }

  std::array<std::uint8_t, 4> mask{};
  if (!recv_exact(fd, ssl, mask.data(), mask.size())) {
    return false;
  }

  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(payload_len));
  if (!bytes.empty() && !recv_exact(fd, ssl, bytes.data(), bytes.size())) {
    return false;
  }
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] ^= mask[i % mask.size()];
  }

  payload.assign(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  return true;
}

bool send_frame(const int fd, SSL *ssl, const std::uint8_t opcode, const std::string &payload) {
  std::vector<std::uint8_t> frame;
  frame.reserve(payload.size() + 16);
  frame.push_back(static_cast<std::uint8_t>(0x80u | (opcode & 0x0Fu)));

  const auto size = payload.size();
  if (size <= 125u) {
    frame.push_back(static_cast<std::uint8_t>(size));
  } else if (size <= 65535u) {
    frame.push_back(126u);
    frame.push_back(static_cast<std::uint8_t>((size >> 8u) & 0xFFu));
    frame.push_back(static_cast<std::uint8_t>(size & 0xFFu));
  } else {
    frame.push_back(127u);
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(
          static_cast<std::uint8_t>((size >> static_cast<std::size_t>(shift)) & 0xFFu));
    }
  }

  frame.insert(frame.end(), payload.begin(), payload.end());
  return send_all(fd, ssl, frame.data(), frame.size());
}

std::string peer_address(const sockaddr_in &addr) {
  std::array<char, INET_ADDRSTRLEN> buffer{};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer.data(), buffer.size()) == nullptr) {
    return "unknown";
  }
  return std::string(buffer.data()) + ":" + std::to_string(ntohs(addr.sin_port));
}

} // namespace

WebSocketServer::ClientState::~ClientState() {
  if (ssl != nullptr) {
    SSL_free(ssl);
    ssl = nullptr;
  }
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

WebSocketServer::WebSocketServer() = default;

WebSocketServer::~WebSocketServer() { stop(); }

common::Status WebSocketServer::start(const WebSocketOptions &options) {
  if (running_) {
    return common::Status::error("websocket server already running");
  }
  if (options.port == 0) {
    return common::Status::error("websocket port must be non-zero");
  }
  if (common::trim(options.host).empty()) {
    return common::Status::error("websocket host is empty");
  }
  if (options.max_queued_messages == 0) {
    return common::Status::error("websocket outbound queue bound must be non-zero");
  }

  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create websocket listen socket");
  }
  int reuse = 1;
  (void)setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  const std::string bind_host = normalize_bind_host(options.host);
  if (inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) {
    ::close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("invalid websocket bind host: " + options.host);
  }
  if (::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string message = std::strerror(errno);
    ::close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("websocket bind failed: " + message);
  }
  if (::listen(listen_fd_, kListenBacklog) != 0) {
    const std::string message = std::strerror(errno);
    ::close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("websocket listen failed: " + message);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  options_ = options;
  if (options_.tls_enabled) {
    const auto fail = [this](const std::string &message) {
      if (tls_ctx_ != nullptr) {
        SSL_CTX_free(tls_ctx_);
        tls_ctx_ = nullptr;
      }
      ::close(listen_fd_);
      listen_fd_ = -1;
      bound_port_ = 0;
      return common::Status::error(message);
    };
    if (options_.tls_cert_file.empty() || options_.tls_key_file.empty()) {
      return fail("websocket TLS requires cert and key file paths");
    }
    tls_ctx_ = SSL_CTX_new(TLS_server_method());
    if (tls_ctx_ == nullptr) {
      return fail("failed to initialize websocket TLS context: " + openssl_error_string());
    }
    SSL_CTX_set_min_proto_version(tls_ctx_, TLS1_2_VERSION);
    if (SSL_CTX_use_certificate_file(tls_ctx_, options_.tls_cert_file.c_str(), SSL_FILETYPE_PEM) <=
        0) {
      return fail("failed loading websocket TLS certificate: " + openssl_error_string());
    }
    if (SSL_CTX_use_PrivateKey_file(tls_ctx_, options_.tls_key_file.c_str(), SSL_FILETYPE_PEM) <=
        0) {
      return fail("failed loading websocket TLS private key: " + openssl_error_string());
    }
    if (SSL_CTX_check_private_key(tls_ctx_) != 1) {
      return fail("websocket TLS private key does not match certificate: " +
                  openssl_error_string());
    }
  }

  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  return common::Status::success();
}

void WebSocketServer::stop() {
  if (!running_ && listen_fd_ < 0 && tls_ctx_ == nullptr) {
    return;
  }
  running_ = false;

  if (listen_fd_ >= 0) {
    ::shutdown(listen_fd_, SHUT_RDWR);
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }

  std::vector<std::uint64_t> ids;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (const auto &[id, client] : clients_) {
      ids.push_back(id);
    }
  }
  for (const auto id : ids) {
    remove_client(id, "server_shutdown");
  }

  {
    std::unique_lock<std::mutex> lock(threads_mutex_);
    if (!threads_cv_.wait_for(lock, kStopGrace, [this]() { return active_threads_ == 0; })) {
      std::cerr << "[broadcast] " << active_threads_ << " client threads still running at stop\n";
    }
  }

  if (tls_ctx_ != nullptr) {
    SSL_CTX_free(tls_ctx_);
    tls_ctx_ = nullptr;
  }
  bound_port_ = 0;
}

bool WebSocketServer::is_running() const { return running_.load(); }

std::uint16_t WebSocketServer::port() const { return bound_port_; }

std::size_t WebSocketServer::connected_clients() const {
  std::lock_guard<std::mutex> lock(clients_mutex_);
  std::size_t count = 0;
  for (const auto &[id, client] : clients_) {
    if (client->open) {
      ++count;
    }
  }
  return count;
}

bool WebSocketServer::send(const std::uint64_t client_id, const std::string &text) {
  std::shared_ptr<ClientState> client;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    const auto it = clients_.find(client_id);
    if (it == clients_.end()) {
      return false;
    }
    client = it->second;
  }
  if (!client->open) {
    return false;
  }
  return enqueue(client, OutboundFrame{.opcode = kOpText, .payload = text});
}

std::size_t WebSocketServer::broadcast(const std::string &text) {
  std::vector<std::shared_ptr<ClientState>> recipients;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    recipients.reserve(clients_.size());
    for (const auto &[id, client] : clients_) {
      if (client->open) {
        recipients.push_back(client);
      }
    }
  }

  std::size_t accepted = 0;
  for (const auto &client : recipients) {
    if (enqueue(client, OutboundFrame{.opcode = kOpText, .payload = text})) {
      ++accepted;
    }
  }
  return accepted;
}

void WebSocketServer::disconnect(const std::uint64_t client_id, const std::string &reason) {
  remove_client(client_id, reason);
}

bool WebSocketServer::enqueue(const std::shared_ptr<ClientState> &client, OutboundFrame frame) {
  bool overflow = false;
  {
    std::lock_guard<std::mutex> lock(client->queue_mutex);
    if (client->closing) {
      return false;
    }
    if (client->outbox.size() >= options_.max_queued_messages) {
      overflow = true;
    } else {
      client->outbox.push_back(std::move(frame));
    }
  }
  if (overflow) {
    remove_client(client->id, "queue_overflow");
    return false;
  }
  client->queue_cv.notify_one();
  return true;
}

void WebSocketServer::spawn(std::function<void()> body) {
  {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    ++active_threads_;
  }
  std::thread([this, body = std::move(body)]() mutable {
    try {
      body();
    } catch (const std::exception &err) {
      std::cerr << "[broadcast] client thread exception: " << err.what() << "\n";
    }
    body = nullptr;
    std::lock_guard<std::mutex> lock(threads_mutex_);
    --active_threads_;
    threads_cv_.notify_all();
  }).detach();
}

void WebSocketServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client_fd =
        ::accept4(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len, SOCK_CLOEXEC);
    if (client_fd < 0) {
      if (!running_) {
        break;
      }
      continue;
    }

    auto client = std::make_shared<ClientState>();
    client->id = next_client_id_.fetch_add(1);
    client->fd = client_fd;
    client->remote = peer_address(client_addr);
    if (tls_ctx_ != nullptr) {
      client->ssl = SSL_new(tls_ctx_);
      if (client->ssl == nullptr) {
        continue;
      }
      SSL_set_fd(client->ssl, client_fd);
    }
    {
      std::lock_guard<std::mutex> lock(clients_mutex_);
      if (clients_.size() >= options_.max_clients) {
        const std::string body = R"({"error":"too_many_observers"})";
        (void)send_http_response(client_fd, client->ssl, 503, "Service Unavailable",
                                 {{"Content-Type", "application/json"}}, body);
        ::shutdown(client_fd, SHUT_RDWR);
        continue;
      }
      clients_[client->id] = client;
    }
    spawn([this, client]() { client_loop(client); });
  }
}

void WebSocketServer::client_loop(const std::shared_ptr<ClientState> client) {
  if (client->ssl != nullptr && SSL_accept(client->ssl) <= 0) {
    remove_client(client->id, "tls_handshake_failed");
    return;
  }
  if (!perform_handshake(client)) {
    remove_client(client->id, "handshake_failed");
    return;
  }

  client->open = true;
  spawn([this, client]() { writer_loop(client); });
  if (options_.on_open) {
    options_.on_open(client->id, client->remote);
  }

  std::string reason = "closed";
  while (running_) {
    std::uint8_t opcode = 0;
    std::string payload;
    if (!read_next_frame(client->fd, client->ssl, opcode, payload)) {
      reason = "read_failed";
      break;
    }
    if (opcode == kOpClose) {
      reason = "client_close";
      break;
    }
    if (opcode == kOpPing) {
      (void)enqueue(client, OutboundFrame{.opcode = kOpPong, .payload = payload});
      continue;
    }
    if (opcode != kOpText) {
      continue;
    }
    if (options_.on_message) {
      options_.on_message(client->id, payload);
    }
  }

  remove_client(client->id, reason);
}

void WebSocketServer::writer_loop(const std::shared_ptr<ClientState> client) {
  while (true) {
    OutboundFrame frame;
    {
      std::unique_lock<std::mutex> lock(client->queue_mutex);
      client->queue_cv.wait(lock, [&client]() { return client->closing || !client->outbox.empty(); });
      if (client->closing) {
        break;
      }
      frame = std::move(client->outbox.front());
      client->outbox.pop_front();
    }
    if (!send_frame(client->fd, client->ssl, frame.opcode, frame.payload)) {
      remove_client(client->id, "write_failed");
      break;
    }
  }
}

bool WebSocketServer::perform_handshake(const std::shared_ptr<ClientState> &client) const {
  if (client == nullptr || client->fd < 0) {
    return false;
  }

  const int fd = client->fd;
  SSL *ssl = client->ssl;
  std::string request;
  request.reserve(1024);
  std::array<char, 1024> buf{};
  while (request.size() < kMaxHandshakeBytes) {
    const ssize_t n =
        read_bytes(fd, ssl, reinterpret_cast<std::uint8_t *>(buf.data()), buf.size());
    if (n <= 0) {
      return false;
    }
    request.append(buf.data(), static_cast<std::size_t>(n));
    if (request.find("\r\n\r\n") != std::string::npos) {
      break;
    }
  }
  if (request.find("\r\n\r\n") == std::string::npos) {
    (void)send_http_response(fd, ssl, 400, "Bad Request", {{"Content-Type", "application/json"}},
                             R"({"error":"invalid_websocket_handshake"})");
    return false;
  }

  const auto headers = parse_headers(request);
  const auto request_line_it = headers.find(":request-line");
  if (request_line_it == headers.end() || request_line_it->second.rfind("GET ", 0) != 0) {
    (void)send_http_response(fd, ssl, 405, "Method Not Allowed",
                             {{"Content-Type", "application/json"}},
                             R"({"error":"websocket_requires_get"})");
    return false;
  }

  const auto upgrade_it = headers.find("upgrade");
  const auto connection_it = headers.find("connection");
  const auto version_it = headers.find("sec-websocket-version");
  const auto key_it = headers.find("sec-websocket-key");
  if (upgrade_it == headers.end() || connection_it == headers.end() ||
      version_it == headers.end() || key_it == headers.end() ||
      lower_trimmed(upgrade_it->second) != "websocket" ||
      common::to_lower(connection_it->second).find("upgrade") == std::string::npos ||
      common::trim(version_it->second) != "13") {
    (void)send_http_response(fd, ssl, 400, "Bad Request", {{"Content-Type", "application/json"}},
                             R"({"error":"missing_websocket_headers"})");
    return false;
  }

  const std::string accept_key = websocket_accept(common::trim(key_it->second));
  return send_http_response(fd, ssl, 101, "Switching Protocols",
                            {{"Upgrade", "websocket"},
                             {"Connection", "Upgrade"},
                             {"Sec-WebSocket-Accept", accept_key}});
}

void WebSocketServer::remove_client(const std::uint64_t client_id, const std::string &reason) {
  std::shared_ptr<ClientState> client;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    const auto it = clients_.find(client_id);
    if (it == clients_.end()) {
      return;
    }
    client = it->second;
    clients_.erase(it);
  }
  {
    std::lock_guard<std::mutex> lock(client->queue_mutex);
    client->closing = true;
    client->outbox.clear();
  }
  client->queue_cv.notify_all();
  if (client->fd >= 0) {
    ::shutdown(client->fd, SHUT_RDWR);
  }
  if (client->open.exchange(false) && options_.on_close) {
    options_.on_close(client_id, reason);
  }
}

} // namespace teamlens::gateway
