#ifndef ZIA_WEBSOCKET_HPP_
#define ZIA_WEBSOCKET_HPP_

#include "frame.hpp"
#include "stream.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <atomic>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace zia {

// Largest UDP payload carried in one binary message.
static constexpr size_t kMaxDatagramSize = 65535;

// ============================================================================
// WebSocket (frame codec over one duplex byte stream)
// ============================================================================

class WebSocket {
 public:
  WebSocket(std::unique_ptr<ByteStream> stream, size_t max_payload_len, Role role);

  WebSocket(WebSocket&&) = default;
  WebSocket& operator=(WebSocket&&) = default;
  WebSocket(const WebSocket&) = delete;
  WebSocket& operator=(const WebSocket&) = delete;

  // Writes header, optional mask key and payload. Server role never masks;
  // client role masks with a fresh random key when masking is enabled.
  // A failed write closes the connection.
  expected<void, ErrorCode> send(const Frame& frame);

  // Decodes exactly one frame. After a Close event or any error the
  // connection is closed and later calls fail with kReadAfterClose.
  expected<Event, ErrorCode> recv();

  // Sends a close frame (code + UTF-8 reason) and closes the connection.
  expected<void, ErrorCode> close(uint16_t code = ws::kCloseNormal, std::string_view reason = {});

  // Splits into {read half, write half} over duplicated stream handles.
  // Both halves share the closed flag.
  static expected<std::pair<WebSocket, WebSocket>, ErrorCode> split(WebSocket&& conn);

  bool is_closed() const { return closed_->load(std::memory_order_acquire); }

  Role role() const { return role_; }

  size_t max_payload_len() const { return max_payload_len_; }

  ByteStream& stream() { return *stream_; }

 private:
  WebSocket(std::unique_ptr<ByteStream> stream, size_t max_payload_len, Role role,
            std::shared_ptr<std::atomic<bool>> closed);

  expected<Event, ErrorCode> recv_event();
  expected<std::vector<uint8_t>, ErrorCode> read_payload(bool masked, size_t len);
  expected<void, ErrorCode> write_frame(const Frame& frame, const uint8_t* mask_key);

  // Marks the connection closed and shuts the stream down.
  void fail();

  static expected<Event, ErrorCode> on_close(const std::vector<uint8_t>& msg);

  std::unique_ptr<ByteStream> stream_;
  size_t max_payload_len_;
  Role role_;
  std::shared_ptr<std::atomic<bool>> closed_;
};

}  // namespace zia

#endif  // ZIA_WEBSOCKET_HPP_
