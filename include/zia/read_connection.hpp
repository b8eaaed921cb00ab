#ifndef ZIA_READ_CONNECTION_HPP_
#define ZIA_READ_CONNECTION_HPP_

#include "peer_address.hpp"
#include "vocabulary.hpp"
#include "websocket.hpp"

#include <cstdint>

#include <atomic>
#include <memory>
#include <sockpp/udp_socket.h>
#include <vector>

namespace zia {

// ============================================================================
// ReadConnection - Read half of a WebSocket feeding the UDP socket
// ============================================================================

class ReadConnection {
 public:
  ReadConnection(WebSocket read, std::shared_ptr<sockpp::udp_socket> socket,
                 std::shared_ptr<PeerAddressTracker> peer);

  ReadConnection(const ReadConnection&) = delete;
  ReadConnection& operator=(const ReadConnection&) = delete;

  // Forwards every binary message to the tracked peer until the connection
  // ends. Returns success on a close frame, otherwise the decode or stream
  // error that ended it.
  expected<void, ErrorCode> run();

  // Unblocks run() from another thread.
  void shutdown() { read_.stream().shutdown(); }

  bool is_closed() const { return read_.is_closed(); }

  uint64_t forwarded() const { return forwarded_.load(std::memory_order_relaxed); }
  uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

 private:
  void forward(const std::vector<uint8_t>& payload);

  WebSocket read_;
  std::shared_ptr<sockpp::udp_socket> socket_;
  std::shared_ptr<PeerAddressTracker> peer_;

  std::atomic<uint64_t> forwarded_{0};
  std::atomic<uint64_t> dropped_{0};
};

}  // namespace zia

#endif  // ZIA_READ_CONNECTION_HPP_
