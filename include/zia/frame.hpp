#ifndef ZIA_FRAME_HPP_
#define ZIA_FRAME_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <string>
#include <utility>
#include <vector>

namespace zia {

// ============================================================================
// WebSocket frame utilities (RFC 6455 section 5.2)
// ============================================================================
//
//  0                   1                   2                   3
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +-+-+-+-+-------+-+-------------+-------------------------------+
// |F|R|R|R| opcode|M| Payload len |    Extended payload length    |
// |I|S|S|S|  (4)  |A|     (7)     |             (16/64)           |
// |N|V|V|V|       |S|             |   (if payload len==126/127)   |
// | |1|2|3|       |K|             |                               |
// +-+-+-+-+-------+-+-------------+ - - - - - - - - - - - - - - - +
// |     Extended payload length continued, if payload len == 127  |
// + - - - - - - - - - - - - - - - +-------------------------------+
// |                               |Masking-key, if MASK set to 1  |
// +-------------------------------+-------------------------------+
// | Masking-key (continued)       |          Payload Data         |
// +-------------------------------- - - - - - - - - - - - - - - - +

namespace ws {

enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

static constexpr uint8_t kFinBit = 0x80;
static constexpr uint8_t kRsvBits = 0x70;
static constexpr uint8_t kOpcodeBits = 0x0F;
static constexpr uint8_t kMaskBit = 0x80;
static constexpr uint8_t kLenBits = 0x7F;

static constexpr uint8_t kLen16 = 126;
static constexpr uint8_t kLen64 = 127;

// 2 (base) + 8 (64-bit length) + 4 (mask key)
static constexpr size_t kMaxHeaderSize = 14;
static constexpr size_t kMaxControlPayload = 125;

static constexpr uint16_t kCloseNormal = 1000;
static constexpr uint16_t kCloseGoingAway = 1001;

inline bool is_control(uint8_t opcode) { return opcode >= 8; }

// Writes FIN/opcode, length and (if mask_key is non-null) the masking key.
// buf must hold kMaxHeaderSize bytes. Returns the header length.
inline size_t encode_frame_header(uint8_t* buf, OpCode opcode, size_t payload_len, bool fin = true,
                                  const uint8_t* mask_key = nullptr) {
  size_t pos = 0;
  buf[pos++] = static_cast<uint8_t>((fin ? kFinBit : 0x00) | static_cast<uint8_t>(opcode));

  uint8_t mask = mask_key != nullptr ? kMaskBit : 0x00;
  if (payload_len < kLen16) {
    buf[pos++] = static_cast<uint8_t>(mask | payload_len);
  } else if (payload_len < 65536) {
    buf[pos++] = static_cast<uint8_t>(mask | kLen16);
    buf[pos++] = static_cast<uint8_t>((payload_len >> 8) & 0xFF);
    buf[pos++] = static_cast<uint8_t>(payload_len & 0xFF);
  } else {
    buf[pos++] = static_cast<uint8_t>(mask | kLen64);
    uint64_t len = static_cast<uint64_t>(payload_len);
    for (int i = 7; i >= 0; --i) {
      buf[pos++] = static_cast<uint8_t>((len >> (i * 8)) & 0xFF);
    }
  }

  if (mask_key != nullptr) {
    std::memcpy(buf + pos, mask_key, 4);
    pos += 4;
  }
  return pos;
}

// XOR byte i with mask_key[i % 4]. Masking and unmasking are the same operation.
inline void apply_mask(uint8_t* payload, size_t len, const uint8_t* mask_key) {
  for (size_t i = 0; i < len; ++i) {
    payload[i] ^= mask_key[i & 3];
  }
}

inline uint16_t read_be16(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

inline uint64_t read_be64(const uint8_t* p) {
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v = (v << 8) | p[i];
  }
  return v;
}

// Close codes accepted on receipt (RFC 6455 section 7.4).
inline bool is_valid_close_code(uint16_t code) {
  return (code >= 1000 && code <= 1003) || (code >= 1007 && code <= 1011) || code == 1015 ||
         (code >= 3000 && code <= 4999);
}

}  // namespace ws

// ============================================================================
// Role
// ============================================================================

// Which side of the connection this endpoint plays. Fixed per connection.
struct Role {
  enum class Kind : uint8_t { kServer, kClient };

  Kind kind = Kind::kServer;
  bool masking = false;  // client only

  static Role server() { return Role{Kind::kServer, false}; }
  static Role client(bool masking) { return Role{Kind::kClient, masking}; }

  bool is_server() const { return kind == Kind::kServer; }
  bool is_client() const { return kind == Kind::kClient; }
};

// ============================================================================
// Frame (outbound, payload borrowed)
// ============================================================================

struct Frame {
  bool fin = true;
  ws::OpCode opcode = ws::OpCode::kBinary;
  const uint8_t* data = nullptr;
  size_t size = 0;

  static Frame binary(const uint8_t* data, size_t size) { return Frame{true, ws::OpCode::kBinary, data, size}; }

  static Frame close(const uint8_t* data, size_t size) { return Frame{true, ws::OpCode::kClose, data, size}; }
};

// ============================================================================
// Event (inbound)
// ============================================================================

struct Event {
  enum class Type : uint8_t { kData, kClose };

  Type type = Type::kData;
  std::vector<uint8_t> data;  // kData
  uint16_t code = 0;          // kClose
  std::string reason;         // kClose

  static Event make_data(std::vector<uint8_t> payload) {
    Event ev;
    ev.type = Type::kData;
    ev.data = std::move(payload);
    return ev;
  }

  static Event make_close(uint16_t code, std::string reason) {
    Event ev;
    ev.type = Type::kClose;
    ev.code = code;
    ev.reason = std::move(reason);
    return ev;
  }

  bool is_data() const { return type == Type::kData; }
  bool is_close() const { return type == Type::kClose; }
};

}  // namespace zia

#endif  // ZIA_FRAME_HPP_
