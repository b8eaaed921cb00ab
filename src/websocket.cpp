#include "zia/websocket.hpp"

#include "zia/log.hpp"
#include "zia/utils.hpp"

#include <cstring>

#include <algorithm>
#include <string>

namespace zia {

WebSocket::WebSocket(std::unique_ptr<ByteStream> stream, size_t max_payload_len, Role role)
    : WebSocket(std::move(stream), max_payload_len, role, std::make_shared<std::atomic<bool>>(false)) {}

WebSocket::WebSocket(std::unique_ptr<ByteStream> stream, size_t max_payload_len, Role role,
                     std::shared_ptr<std::atomic<bool>> closed)
    : stream_(std::move(stream)), max_payload_len_(max_payload_len), role_(role), closed_(std::move(closed)) {}

// ============================================================================
// Send path
// ============================================================================

expected<void, ErrorCode> WebSocket::send(const Frame& frame) {
  if (is_closed()) {
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }

  expected<void, ErrorCode> result = expected<void, ErrorCode>::success();
  if (role_.is_client() && role_.masking) {
    uint32_t key = random_u32();
    uint8_t mask_key[4];
    std::memcpy(mask_key, &key, sizeof(mask_key));
    result = write_frame(frame, mask_key);
  } else {
    result = write_frame(frame, nullptr);
  }

  if (!result.has_value()) {
    fail();
  }
  return result;
}

expected<void, ErrorCode> WebSocket::write_frame(const Frame& frame, const uint8_t* mask_key) {
  uint8_t header[ws::kMaxHeaderSize];
  size_t header_len = ws::encode_frame_header(header, frame.opcode, frame.size, frame.fin, mask_key);

  if (mask_key == nullptr) {
    // Header on stack, payload straight from the caller's buffer
    struct iovec iov[2];
    iov[0].iov_base = header;
    iov[0].iov_len = header_len;
    iov[1].iov_base = const_cast<uint8_t*>(frame.data);
    iov[1].iov_len = frame.size;
    return stream_->write_vectored(iov, frame.size > 0 ? 2 : 1);
  }

  // The payload is borrowed, so masking happens on a copy
  std::vector<uint8_t> buf(header_len + frame.size);
  std::memcpy(buf.data(), header, header_len);
  if (frame.size > 0) {
    std::memcpy(buf.data() + header_len, frame.data, frame.size);
    ws::apply_mask(buf.data() + header_len, frame.size, mask_key);
  }
  return stream_->write_all(buf.data(), buf.size());
}

expected<void, ErrorCode> WebSocket::close(uint16_t code, std::string_view reason) {
  if (is_closed()) {
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }

  uint8_t payload[ws::kMaxControlPayload];
  payload[0] = static_cast<uint8_t>((code >> 8) & 0xFF);
  payload[1] = static_cast<uint8_t>(code & 0xFF);
  size_t reason_len = std::min(reason.size(), ws::kMaxControlPayload - 2);
  if (reason_len > 0) {
    std::memcpy(payload + 2, reason.data(), reason_len);
  }

  auto result = send(Frame::close(payload, 2 + reason_len));
  closed_->store(true, std::memory_order_release);
  return result;
}

void WebSocket::fail() {
  closed_->store(true, std::memory_order_release);
  if (stream_) {
    stream_->shutdown();
  }
}

expected<std::pair<WebSocket, WebSocket>, ErrorCode> WebSocket::split(WebSocket&& conn) {
  auto writer_stream = conn.stream_->clone();
  if (!writer_stream.has_value()) {
    return expected<std::pair<WebSocket, WebSocket>, ErrorCode>::error(writer_stream.get_error());
  }

  WebSocket writer(std::move(writer_stream.value()), conn.max_payload_len_, conn.role_, conn.closed_);
  WebSocket reader(std::move(conn.stream_), conn.max_payload_len_, conn.role_, conn.closed_);
  return expected<std::pair<WebSocket, WebSocket>, ErrorCode>::success(
      std::pair<WebSocket, WebSocket>(std::move(reader), std::move(writer)));
}

// ============================================================================
// Receive path
// ============================================================================

expected<Event, ErrorCode> WebSocket::recv() {
  if (is_closed()) {
    return expected<Event, ErrorCode>::error(ErrorCode::kReadAfterClose);
  }

  auto event = recv_event();
  if (!event.has_value()) {
    fail();
  } else if (event.value().is_close()) {
    closed_->store(true, std::memory_order_release);
  }
  return event;
}

expected<Event, ErrorCode> WebSocket::recv_event() {
  using Result = expected<Event, ErrorCode>;

  uint8_t buf[8];
  auto header = stream_->read_exact(buf, 2);
  if (!header.has_value()) {
    return Result::error(header.get_error());
  }

  bool fin = (buf[0] & ws::kFinBit) != 0;
  uint8_t rsv = buf[0] & ws::kRsvBits;
  uint8_t opcode = buf[0] & ws::kOpcodeBits;
  bool masked = (buf[1] & ws::kMaskBit) != 0;
  uint64_t len = buf[1] & ws::kLenBits;

  // No extension is ever negotiated
  if (rsv != 0) {
    return Result::error(ErrorCode::kReservedBitsSet);
  }

  // RFC 6455 requires servers to reject unmasked client frames; the server
  // side accepts both so that unmasking clients can connect.
  if (role_.is_client() && masked) {
    return Result::error(ErrorCode::kUnexpectedMask);
  }

  if (ws::is_control(opcode)) {
    if (!fin) {
      return Result::error(ErrorCode::kFragmentedControl);
    }
    if (len > ws::kMaxControlPayload) {
      return Result::error(ErrorCode::kControlFrameTooLong);
    }
    if (len > max_payload_len_) {
      return Result::error(ErrorCode::kPayloadTooLarge);
    }
    auto msg = read_payload(masked, static_cast<size_t>(len));
    if (!msg.has_value()) {
      return Result::error(msg.get_error());
    }
    // 9 (ping) and 10 (pong) are not handled; 11-15 are reserved
    if (opcode != static_cast<uint8_t>(ws::OpCode::kClose)) {
      return Result::error(ErrorCode::kUnknownOpcode);
    }
    return on_close(msg.value());
  }

  // Only complete binary messages; 3-7 are reserved
  if (opcode != static_cast<uint8_t>(ws::OpCode::kBinary) || !fin) {
    return Result::error(ErrorCode::kInvalidDataFrame);
  }

  if (len == ws::kLen16) {
    auto ext = stream_->read_exact(buf, 2);
    if (!ext.has_value()) {
      return Result::error(ext.get_error());
    }
    len = ws::read_be16(buf);
  } else if (len == ws::kLen64) {
    auto ext = stream_->read_exact(buf, 8);
    if (!ext.has_value()) {
      return Result::error(ext.get_error());
    }
    len = ws::read_be64(buf);
  }

  // Checked before anything is allocated for the payload
  if (len > max_payload_len_) {
    return Result::error(ErrorCode::kPayloadTooLarge);
  }

  auto data = read_payload(masked, static_cast<size_t>(len));
  if (!data.has_value()) {
    return Result::error(data.get_error());
  }
  return Result::success(Event::make_data(std::move(data.value())));
}

expected<std::vector<uint8_t>, ErrorCode> WebSocket::read_payload(bool masked, size_t len) {
  using Result = expected<std::vector<uint8_t>, ErrorCode>;

  uint8_t mask_key[4];
  if (masked) {
    auto key = stream_->read_exact(mask_key, sizeof(mask_key));
    if (!key.has_value()) {
      return Result::error(key.get_error());
    }
  }

  std::vector<uint8_t> data(len);
  if (len > 0) {
    auto body = stream_->read_exact(data.data(), len);
    if (!body.has_value()) {
      return Result::error(body.get_error());
    }
  }

  if (masked) {
    ws::apply_mask(data.data(), data.size(), mask_key);
  }
  return Result::success(std::move(data));
}

// The first two bytes, if present, carry the status code (1000 otherwise);
// the rest is the UTF-8 reason.
expected<Event, ErrorCode> WebSocket::on_close(const std::vector<uint8_t>& msg) {
  using Result = expected<Event, ErrorCode>;

  uint16_t code = msg.size() >= 2 ? ws::read_be16(msg.data()) : ws::kCloseNormal;
  if (!ws::is_valid_close_code(code)) {
    return Result::error(ErrorCode::kInvalidCloseCode);
  }

  if (msg.size() <= 2) {
    return Result::success(Event::make_close(code, std::string()));
  }

  const uint8_t* reason = msg.data() + 2;
  size_t reason_len = msg.size() - 2;
  if (!is_valid_utf8(reason, reason_len)) {
    return Result::error(ErrorCode::kInvalidUtf8);
  }
  return Result::success(Event::make_close(code, std::string(reinterpret_cast<const char*>(reason), reason_len)));
}

}  // namespace zia
