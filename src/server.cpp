#include "zia/server.hpp"

#include "zia/handshake.hpp"
#include "zia/log.hpp"
#include "zia/read_connection.hpp"
#include "zia/websocket.hpp"

#include <cerrno>
#include <cstring>

#include <array>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace zia {

namespace {

constexpr int kPollTimeoutMs = 200;
constexpr int kListenBacklog = 128;

// Waits for POLLIN on fd. 1 readable, 0 timeout, -1 error.
int wait_readable(int fd, int timeout_ms) {
  struct pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int ret = ::poll(&pfd, 1, timeout_ms);
  if (ret < 0) {
    return errno == EINTR ? 0 : -1;
  }
  return ret > 0 ? 1 : 0;
}

}  // namespace

Server::Server(ServerConfig config, WritePoolOptions pool_options)
    : config_(std::move(config)), upstream_(config_.upstream.host, config_.upstream.port) {
  sockpp::inet_address listen_addr(config_.listen_addr.host, config_.listen_addr.port);
  if (!acceptor_.open(listen_addr, kListenBacklog)) {
    ZIA_THROW(std::runtime_error("Failed to listen on " + listen_addr.to_string() + ": " +
                                 acceptor_.last_error_str()));
  }

  if (config_.mode == ListenerMode::kWebSocket) {
    socket_ = std::make_shared<sockpp::udp_socket>();
    if (!socket_->bind(sockpp::inet_address(in_port_t(0)))) {
      ZIA_THROW(std::runtime_error("Failed to bind upstream UDP socket: " + socket_->last_error_str()));
    }
    // Datagrams from the upstream are the only inbound traffic
    peer_ = std::make_shared<PeerAddressTracker>(upstream_);
    pool_ = std::make_unique<WritePool>(socket_, peer_, pool_options);
  }

  ZIA_LOG_INFO(std::string("Listening in ") + to_string(config_.mode) + "://" + local_address().to_string() + "...");
}

Server::~Server() {
  stop();
  if (pool_thread_.joinable()) {
    pool_thread_.join();
  }
  reap_workers(true);
}

void Server::stop() {
  stopping_.store(true, std::memory_order_release);
  if (pool_) {
    pool_->stop();
  }
}

bool Server::track(uint64_t id, std::function<void()> cancel) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopping_.load(std::memory_order_acquire)) {
    return false;
  }
  cancels_[id] = std::move(cancel);
  return true;
}

void Server::untrack(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  cancels_.erase(id);
}

void Server::reap_workers(bool all) {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (all || it->done->load(std::memory_order_acquire)) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

expected<void, ErrorCode> Server::run() {
  auto result = expected<void, ErrorCode>::success();
  stats_.reset();

  if (pool_) {
    pool_thread_ = std::thread([this] {
      auto executed = pool_->execute();
      if (!executed.has_value()) {
        ZIA_LOG_ERROR(std::string("Upstream UDP socket failed: ") + to_string(executed.get_error()));
        stop();
      }
    });
  }

  while (!stopping_.load(std::memory_order_acquire)) {
    reap_workers(false);

    int ready = wait_readable(acceptor_.handle(), kPollTimeoutMs);
    if (ready < 0) {
      ZIA_LOG_ERROR("Poll on listener failed: " + std::string(strerror(errno)));
      result = expected<void, ErrorCode>::error(ErrorCode::kSocketError);
      break;
    }
    if (ready == 0) {
      continue;
    }

    sockpp::inet_address peer;
    sockpp::tcp_socket sock = acceptor_.accept(&peer);
    if (!sock) {
      ZIA_LOG_WARN("Accept failed: " + acceptor_.last_error_str());
      continue;
    }
    set_tcp_nodelay(sock);

    uint64_t id = next_id_++;
    stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
    ZIA_LOG_INFO("Connection #" + std::to_string(id) + " from " + peer.to_string());

    auto done = std::make_shared<std::atomic<bool>>(false);
    Worker worker;
    worker.done = done;
    worker.thread = std::thread([this, id, done, s = std::move(sock)]() mutable {
      stats_.active_connections.fetch_add(1, std::memory_order_relaxed);
      serve_connection(id, std::move(s));
      stats_.active_connections.fetch_sub(1, std::memory_order_relaxed);
      done->store(true, std::memory_order_release);
    });
    workers_.push_back(std::move(worker));
  }

  // Shutdown: stop reading datagrams, say goodbye on idle connections,
  // then unblock and join every connection thread
  stop();
  if (pool_thread_.joinable()) {
    pool_thread_.join();
  }
  if (pool_) {
    pool_->close_all(ws::kCloseGoingAway, "server shutdown");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : cancels_) {
      entry.second();
    }
  }
  reap_workers(true);

  ZIA_LOG_INFO("Socket closed, " + std::to_string(stats_.total_connections.load()) + " connections served");
  return result;
}

void Server::serve_connection(uint64_t id, sockpp::tcp_socket sock) {
  auto stream = std::make_unique<TcpStream>(std::move(sock));
  switch (config_.mode) {
    case ListenerMode::kWebSocket:
      serve_websocket(id, std::move(stream));
      break;
    case ListenerMode::kPassThrough:
      serve_pass_through(id, std::move(stream));
      break;
  }
  ZIA_LOG_INFO("Connection #" + std::to_string(id) + " closed");
}

void Server::serve_websocket(uint64_t id, std::unique_ptr<TcpStream> stream) {
  auto upgraded = server_handshake(*stream);
  if (!upgraded.has_value()) {
    stats_.rejected_handshakes.fetch_add(1, std::memory_order_relaxed);
    ZIA_LOG_WARN("Connection #" + std::to_string(id) + ": handshake failed: " + to_string(upgraded.get_error()));
    return;
  }

  WebSocket conn(std::move(stream), kMaxDatagramSize, Role::server());
  auto halves = WebSocket::split(std::move(conn));
  if (!halves.has_value()) {
    return;
  }

  ReadConnection reader(std::move(halves.value().first), socket_, peer_);
  if (!track(id, [&reader] { reader.shutdown(); })) {
    return;
  }
  pool_->push(std::make_unique<WriteConnection>(std::move(halves.value().second)));

  auto result = reader.run();
  reader.shutdown();
  untrack(id);

  if (!result.has_value() && !stopping_.load(std::memory_order_acquire)) {
    ZIA_LOG_DEBUG("Connection #" + std::to_string(id) + " ended: " + to_string(result.get_error()));
  }
}

void Server::serve_pass_through(uint64_t id, std::unique_ptr<TcpStream> stream) {
  sockpp::udp_socket udp;
  if (!udp.connect(upstream_)) {
    ZIA_LOG_ERROR("Connection #" + std::to_string(id) + ": unable to reach upstream " + upstream_.to_string() + ": " +
                  udp.last_error_str());
    return;
  }

  TcpStream* raw = stream.get();
  if (!track(id, [raw] { raw->shutdown(); })) {
    return;
  }

  std::atomic<bool> done{false};

  // Upstream to client
  std::thread back([&] {
    std::vector<uint8_t> buf(kMaxDatagramSize);
    while (!done.load(std::memory_order_acquire)) {
      int ready = wait_readable(udp.handle(), kPollTimeoutMs);
      if (ready < 0) {
        break;
      }
      if (ready == 0) {
        continue;
      }
      ssize_t n = udp.recv(buf.data(), buf.size());
      if (n < 0) {
        // ICMP port unreachable surfaces here; the upstream may come back
        if (udp.last_error() == ECONNREFUSED || udp.last_error() == EINTR) {
          continue;
        }
        ZIA_LOG_WARN("Connection #" + std::to_string(id) + ": upstream receive failed: " + udp.last_error_str());
        break;
      }
      if (!raw->write_all(buf.data(), static_cast<size_t>(n)).has_value()) {
        break;
      }
    }
    raw->shutdown();
  });

  // Client to upstream, one read per datagram
  std::vector<uint8_t> buf(kMaxDatagramSize);
  while (true) {
    auto n = raw->read_some(buf.data(), buf.size());
    if (!n.has_value()) {
      break;
    }
    if (udp.send(buf.data(), n.value()) < 0) {
      ZIA_LOG_WARN("Connection #" + std::to_string(id) + ": datagram to upstream dropped: " + udp.last_error_str());
    }
  }

  done.store(true, std::memory_order_release);
  raw->shutdown();
  back.join();
  untrack(id);
}

}  // namespace zia
