#ifndef ZIA_WRITE_POOL_HPP_
#define ZIA_WRITE_POOL_HPP_

#include "connection_pool.hpp"
#include "peer_address.hpp"
#include "task_group.hpp"
#include "vocabulary.hpp"
#include "websocket.hpp"

#include <cstddef>
#include <cstdint>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <sockpp/udp_socket.h>
#include <string_view>

namespace zia {

// ============================================================================
// WriteConnection - Write half of a WebSocket plus its datagram buffer
// ============================================================================

class WriteConnection {
 public:
  explicit WriteConnection(WebSocket write);

  WriteConnection(const WriteConnection&) = delete;
  WriteConnection& operator=(const WriteConnection&) = delete;

  // Sends the first size bytes of the buffer as one binary message.
  expected<void, ErrorCode> flush(size_t size);

  expected<void, ErrorCode> close(uint16_t code, std::string_view reason);

  bool is_closed() const { return write_.is_closed(); }

  uint8_t* buffer() { return buf_->data(); }
  static constexpr size_t capacity() { return kMaxDatagramSize; }

 private:
  WebSocket write_;
  // Allocated once, never resized
  std::unique_ptr<std::array<uint8_t, kMaxDatagramSize>> buf_;
};

// ============================================================================
// WritePool - UDP socket to WebSocket multiplexer
// ============================================================================

struct WritePoolOptions {
  std::chrono::milliseconds empty_backoff{1000};  // wait when no connection is pooled
  int poll_timeout_ms = 200;                      // granularity of stop()
  size_t workers = 4;
  size_t max_pending = 256;
};

class WritePool {
 public:
  using Pool = ConnectionPool<WriteConnection>;

  WritePool(std::shared_ptr<sockpp::udp_socket> socket, std::shared_ptr<PeerAddressTracker> peer,
            WritePoolOptions options = WritePoolOptions());
  ~WritePool();

  WritePool(const WritePool&) = delete;
  WritePool& operator=(const WritePool&) = delete;

  void push(std::unique_ptr<WriteConnection> conn);

  // Runs the receive loop until stop(). Datagram reads are serialized;
  // each one is written out by a worker while the loop reads the next.
  // Returns error(kSocketError) if the UDP socket fails. In-flight writes
  // have finished when this returns. Call at most once.
  expected<void, ErrorCode> execute();

  // Thread-safe; execute() returns within one poll timeout.
  void stop();

  // Sends a close frame on every pooled connection and empties the pool.
  void close_all(uint16_t code = ws::kCloseGoingAway, std::string_view reason = "shutdown");

  size_t size() const { return pool_.size(); }
  bool is_stopped() const { return stopped_.load(std::memory_order_acquire); }

  const PoolStats& pool_stats() const { return pool_.stats(); }
  uint64_t datagrams() const { return datagrams_.load(std::memory_order_relaxed); }
  uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

 private:
  // Waits up to poll_timeout_ms for a readable socket.
  // Returns error(kTimeout) when nothing arrived.
  expected<void, ErrorCode> wait_readable();

  // Sleeps for the backoff or until stop().
  void backoff();

  std::shared_ptr<sockpp::udp_socket> socket_;
  std::shared_ptr<PeerAddressTracker> peer_;
  WritePoolOptions options_;

  Pool pool_;
  TaskGroup tasks_;

  std::atomic<bool> stopped_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::atomic<uint64_t> datagrams_{0};
  std::atomic<uint64_t> dropped_{0};
};

}  // namespace zia

#endif  // ZIA_WRITE_POOL_HPP_
