#include "zia/write_pool.hpp"

#include "zia/log.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace zia {

// ============================================================================
// WriteConnection
// ============================================================================

WriteConnection::WriteConnection(WebSocket write)
    : write_(std::move(write)), buf_(std::make_unique<std::array<uint8_t, kMaxDatagramSize>>()) {}

expected<void, ErrorCode> WriteConnection::flush(size_t size) {
  if (size > kMaxDatagramSize) {
    return expected<void, ErrorCode>::error(ErrorCode::kPayloadTooLarge);
  }
  return write_.send(Frame::binary(buf_->data(), size));
}

expected<void, ErrorCode> WriteConnection::close(uint16_t code, std::string_view reason) {
  return write_.close(code, reason);
}

// ============================================================================
// WritePool
// ============================================================================

WritePool::WritePool(std::shared_ptr<sockpp::udp_socket> socket, std::shared_ptr<PeerAddressTracker> peer,
                     WritePoolOptions options)
    : socket_(std::move(socket)),
      peer_(std::move(peer)),
      options_(options),
      tasks_(options.workers, options.max_pending) {
  if (!socket_ || !peer_) {
    ZIA_THROW(std::invalid_argument("WritePool requires a socket and a peer address tracker"));
  }
}

WritePool::~WritePool() {
  stop();
  tasks_.shutdown(ShutdownMode::kAbandon);
}

void WritePool::push(std::unique_ptr<WriteConnection> conn) { pool_.push(std::move(conn)); }

void WritePool::stop() {
  stopped_.store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lock(stop_mutex_);
  stop_cv_.notify_all();
}

void WritePool::backoff() {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  stop_cv_.wait_for(lock, options_.empty_backoff, [this] { return is_stopped(); });
}

expected<void, ErrorCode> WritePool::wait_readable() {
  struct pollfd pfd;
  pfd.fd = socket_->handle();
  pfd.events = POLLIN;
  pfd.revents = 0;

  int ret = ::poll(&pfd, 1, options_.poll_timeout_ms);
  if (ret == 0) {
    return expected<void, ErrorCode>::error(ErrorCode::kTimeout);
  }
  if (ret < 0) {
    if (errno == EINTR) {
      return expected<void, ErrorCode>::error(ErrorCode::kTimeout);
    }
    ZIA_LOG_ERROR("Poll on UDP socket failed: " + std::string(strerror(errno)));
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  // A shut down UDP socket polls readable and hung up; recv would return 0 forever
  if ((pfd.revents & (POLLHUP | POLLNVAL)) != 0) {
    ZIA_LOG_ERROR("UDP socket was shut down");
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  if ((pfd.revents & POLLERR) != 0 && (pfd.revents & POLLIN) == 0) {
    ZIA_LOG_ERROR("UDP socket reported an error condition");
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> WritePool::execute() {
  auto result = expected<void, ErrorCode>::success();

  while (!is_stopped()) {
    auto lease = pool_.acquire();
    if (!lease.has_value()) {
      ZIA_LOG_WARN("Write pool is empty, waiting " + std::to_string(options_.empty_backoff.count()) + "ms");
      backoff();
      continue;
    }

    // Closed between acquire() and here; drop it without reading
    if (lease.value()->is_closed()) {
      lease.value().detach();
      continue;
    }

    auto ready = wait_readable();
    if (!ready.has_value()) {
      if (ready.get_error() == ErrorCode::kTimeout) {
        continue;
      }
      result = expected<void, ErrorCode>::error(ready.get_error());
      break;
    }

    sockpp::inet_address source;
    ssize_t n = socket_->recv_from(lease.value()->buffer(), WriteConnection::capacity(), &source);
    if (n < 0) {
      int err = socket_->last_error();
      if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK) {
        continue;
      }
      ZIA_LOG_ERROR("Unable to receive datagram: " + socket_->last_error_str());
      result = expected<void, ErrorCode>::error(ErrorCode::kSocketError);
      break;
    }
    datagrams_.fetch_add(1, std::memory_order_relaxed);

    if (peer_->update(source)) {
      ZIA_LOG_INFO("Peer address is now " + source.to_string());
    }

    // std::function needs a copyable callable
    auto job_lease = std::make_shared<Pool::Lease>(std::move(lease.value()));
    size_t size = static_cast<size_t>(n);
    bool queued = tasks_.spawn([this, job_lease, size]() {
      auto flushed = (*job_lease)->flush(size);
      if (!flushed.has_value()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        ZIA_LOG_ERROR(std::string("Unable to flush websocket buffer: ") + to_string(flushed.get_error()));
      }
    });
    if (!queued) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      ZIA_LOG_WARN("Write queue full, datagram dropped");
    }
  }

  tasks_.shutdown(ShutdownMode::kAwait);
  return result;
}

void WritePool::close_all(uint16_t code, std::string_view reason) {
  auto conns = pool_.drain();
  size_t closed = 0;
  for (auto& conn : conns) {
    if (conn->is_closed()) {
      continue;
    }
    auto sent = conn->close(code, reason);
    if (!sent.has_value()) {
      ZIA_LOG_DEBUG(std::string("Close frame not sent: ") + to_string(sent.get_error()));
      continue;
    }
    ++closed;
  }
  ZIA_LOG_DEBUG("Closed " + std::to_string(closed) + " of " + std::to_string(conns.size()) + " write connections");
}

}  // namespace zia
