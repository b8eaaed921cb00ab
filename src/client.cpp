#include "zia/client.hpp"

#include "zia/handshake.hpp"
#include "zia/log.hpp"
#include "zia/upstream.hpp"
#include "zia/websocket.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace zia {

namespace {

constexpr std::chrono::milliseconds kReconnectMin{1000};
constexpr std::chrono::milliseconds kReconnectMax{30000};

}  // namespace

Client::Client(ClientConfig config, WritePoolOptions pool_options)
    : config_(std::move(config)),
      socket_(std::make_shared<sockpp::udp_socket>()),
      peer_(std::make_shared<PeerAddressTracker>()) {
  sockpp::inet_address addr(config_.listen_addr.host, config_.listen_addr.port);
  if (!socket_->bind(addr)) {
    ZIA_THROW(std::runtime_error("Failed to bind " + addr.to_string() + "/udp: " + socket_->last_error_str()));
  }

  if (config_.upstream.is_tls()) {
    auto ctx = TlsContext::create(config_.tls);
    if (!ctx.has_value()) {
      ZIA_THROW(std::runtime_error("TLS is unavailable for " + config_.upstream.to_string()));
    }
    tls_ = ctx.value();
  }

  pool_ = std::make_unique<WritePool>(socket_, peer_, pool_options);
  ZIA_LOG_INFO("Listening on " + local_address().to_string() + "/udp");
}

Client::~Client() {
  stop();
  for (auto& t : supervisors_) {
    if (t.joinable()) {
      t.join();
    }
  }
}

void Client::stop() {
  stopping_.store(true, std::memory_order_release);
  pool_->stop();

  std::lock_guard<std::mutex> lock(mutex_);
  cv_.notify_all();
}

bool Client::wait_retry(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, delay, [this] { return stopping_.load(std::memory_order_acquire); });
  return !stopping_.load(std::memory_order_acquire);
}

expected<void, ErrorCode> Client::run() {
  if (config_.has_proxy) {
    ZIA_LOG_INFO("Using upstream at " + config_.upstream.to_string() + " via proxy " + config_.proxy.to_string() +
                 "...");
  } else {
    ZIA_LOG_INFO("Using upstream at " + config_.upstream.to_string() + "...");
  }

  for (size_t slot = 0; slot < config_.connections; ++slot) {
    supervisors_.emplace_back(&Client::supervise, this, slot);
  }

  auto result = pool_->execute();
  if (!result.has_value()) {
    ZIA_LOG_ERROR(std::string("UDP socket failed: ") + to_string(result.get_error()));
  }

  stop();
  // Idle write halves say goodbye before the sockets go down
  pool_->close_all(ws::kCloseGoingAway, "client shutdown");
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (ReadConnection* reader : readers_) {
      reader->shutdown();
    }
  }
  for (auto& t : supervisors_) {
    if (t.joinable()) {
      t.join();
    }
  }
  supervisors_.clear();

  ZIA_LOG_INFO("Transmission via " + config_.upstream.to_string() + " closed");
  return result;
}

void Client::supervise(size_t slot) {
  std::chrono::milliseconds delay = kReconnectMin;
  while (!stopping_.load(std::memory_order_acquire)) {
    if (run_session(slot)) {
      delay = kReconnectMin;
    } else {
      delay = std::min(delay * 2, kReconnectMax);
    }
    if (!wait_retry(delay)) {
      break;
    }
  }
  ZIA_LOG_DEBUG("Connection slot " + std::to_string(slot) + " stopped");
}

// Returns true if a session was established, false if setup failed.
bool Client::run_session(size_t slot) {
  const Url* proxy = config_.has_proxy ? &config_.proxy : nullptr;
  auto stream = connect_upstream(config_.upstream, proxy, tls_);
  if (!stream.has_value()) {
    ZIA_LOG_WARN("Slot " + std::to_string(slot) + ": unable to reach upstream: " + to_string(stream.get_error()));
    return false;
  }

  auto upgraded = client_handshake(*stream.value(), config_.upstream);
  if (!upgraded.has_value()) {
    ZIA_LOG_WARN("Slot " + std::to_string(slot) + ": websocket upgrade failed: " + to_string(upgraded.get_error()));
    return false;
  }

  WebSocket conn(std::move(stream.value()), kMaxDatagramSize, Role::client(true));
  auto halves = WebSocket::split(std::move(conn));
  if (!halves.has_value()) {
    return false;
  }

  ReadConnection reader(std::move(halves.value().first), socket_, peer_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_.load(std::memory_order_acquire)) {
      return true;
    }
    readers_.insert(&reader);
  }
  pool_->push(std::make_unique<WriteConnection>(std::move(halves.value().second)));
  ZIA_LOG_INFO("Slot " + std::to_string(slot) + ": connected to " + config_.upstream.to_string());

  auto result = reader.run();
  // The write half shares the closed flag; release the socket for both
  reader.shutdown();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    readers_.erase(&reader);
  }
  if (!result.has_value() && !stopping_.load(std::memory_order_acquire)) {
    ZIA_LOG_WARN("Slot " + std::to_string(slot) + ": connection lost: " + to_string(result.get_error()));
  }
  return true;
}

}  // namespace zia
