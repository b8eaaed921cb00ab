#include "test_helpers.hpp"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace zia;

namespace {

// Encodes payload as `writer` would put it on the wire.
std::vector<uint8_t> encode_with(Role writer, const std::vector<uint8_t>& payload) {
  MemoryConnection conn({}, writer);
  auto sent = conn.ws.send(Frame::binary(payload.data(), payload.size()));
  REQUIRE(sent.has_value());
  return conn.state->output;
}

const uint8_t kKey[4] = {0x01, 0x02, 0x03, 0x04};

}  // namespace

// ============================================================================
// Round trip
// ============================================================================

TEST_CASE("WebSocket - binary round trip across length encodings", "[websocket]") {
  for (size_t len : {size_t(0), size_t(1), size_t(125), size_t(126), size_t(65535), size_t(65536), size_t(70000)}) {
    auto payload = pattern(len);
    auto wire = encode_with(Role::server(), payload);

    MemoryConnection reader(wire, Role::client(true), 1 << 20);
    auto event = reader.ws.recv();
    REQUIRE(event.has_value());
    REQUIRE(event.value().is_data());
    REQUIRE(event.value().data == payload);
    REQUIRE_FALSE(reader.ws.is_closed());
  }
}

TEST_CASE("WebSocket - client masked frame decodes unchanged at the server", "[websocket]") {
  auto payload = pattern(512);
  auto wire = encode_with(Role::client(true), payload);

  REQUIRE((wire[1] & ws::kMaskBit) != 0);
  // Masked on the wire
  REQUIRE(std::vector<uint8_t>(wire.begin() + 8, wire.end()) != payload);

  MemoryConnection reader(wire, Role::server());
  auto event = reader.ws.recv();
  REQUIRE(event.has_value());
  REQUIRE(event.value().data == payload);
}

TEST_CASE("WebSocket - client without masking sends plain frames", "[websocket]") {
  auto payload = pattern(10);
  auto wire = encode_with(Role::client(false), payload);
  REQUIRE(wire.size() == 12);
  REQUIRE((wire[1] & ws::kMaskBit) == 0);
}

TEST_CASE("WebSocket - server accepts unmasked client frames", "[websocket]") {
  MemoryConnection reader(raw_frame(0x82, {1, 2, 3}), Role::server());
  auto event = reader.ws.recv();
  REQUIRE(event.has_value());
  REQUIRE(event.value().data == std::vector<uint8_t>{1, 2, 3});
}

TEST_CASE("WebSocket - frames are decoded one per call", "[websocket]") {
  auto wire = raw_frame(0x82, {1});
  auto second = raw_frame(0x82, {2, 2});
  wire.insert(wire.end(), second.begin(), second.end());

  MemoryConnection reader(wire, Role::client(true));
  auto a = reader.ws.recv();
  auto b = reader.ws.recv();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a.value().data.size() == 1);
  REQUIRE(b.value().data.size() == 2);
}

// ============================================================================
// Rejections
// ============================================================================

TEST_CASE("WebSocket - reserved bits are rejected", "[websocket]") {
  for (uint8_t rsv : {uint8_t(0x40), uint8_t(0x20), uint8_t(0x10)}) {
    MemoryConnection reader(raw_frame(static_cast<uint8_t>(0x82 | rsv), {1}), Role::server());
    auto event = reader.ws.recv();
    REQUIRE_FALSE(event.has_value());
    REQUIRE(event.get_error() == ErrorCode::kReservedBitsSet);
    REQUIRE(reader.ws.is_closed());
  }
}

TEST_CASE("WebSocket - masked frame at a client is rejected", "[websocket]") {
  MemoryConnection reader(raw_frame(0x82, {1, 2}, kKey), Role::client(true));
  auto event = reader.ws.recv();
  REQUIRE_FALSE(event.has_value());
  REQUIRE(event.get_error() == ErrorCode::kUnexpectedMask);
}

TEST_CASE("WebSocket - non-final control frame is rejected", "[websocket]") {
  MemoryConnection reader(raw_frame(0x08, {0x03, 0xE8}), Role::server());
  auto event = reader.ws.recv();
  REQUIRE_FALSE(event.has_value());
  REQUIRE(event.get_error() == ErrorCode::kFragmentedControl);
}

TEST_CASE("WebSocket - control frame longer than 125 bytes is rejected", "[websocket]") {
  std::vector<uint8_t> payload(126, 'a');
  payload[0] = 0x03;
  payload[1] = 0xE8;
  MemoryConnection reader(raw_frame(0x88, payload), Role::server());
  auto event = reader.ws.recv();
  REQUIRE_FALSE(event.has_value());
  REQUIRE(event.get_error() == ErrorCode::kControlFrameTooLong);
}

TEST_CASE("WebSocket - ping and pong are not handled", "[websocket]") {
  for (uint8_t b0 : {uint8_t(0x89), uint8_t(0x8A), uint8_t(0x8B)}) {
    MemoryConnection reader(raw_frame(b0, {}), Role::server());
    auto event = reader.ws.recv();
    REQUIRE_FALSE(event.has_value());
    REQUIRE(event.get_error() == ErrorCode::kUnknownOpcode);
  }
}

TEST_CASE("WebSocket - text, continuation and fragmented data are rejected", "[websocket]") {
  // text, continuation, non-final binary, reserved data opcode
  for (uint8_t b0 : {uint8_t(0x81), uint8_t(0x80), uint8_t(0x02), uint8_t(0x83)}) {
    MemoryConnection reader(raw_frame(b0, {1}), Role::server());
    auto event = reader.ws.recv();
    REQUIRE_FALSE(event.has_value());
    REQUIRE(event.get_error() == ErrorCode::kInvalidDataFrame);
  }
}

TEST_CASE("WebSocket - oversized payload fails before the payload is read", "[websocket]") {
  // Header announces 70000 bytes, only 10 follow
  std::vector<uint8_t> wire = {0x82, 127, 0, 0, 0, 0, 0, 0x01, 0x11, 0x70};
  wire.resize(wire.size() + 10, 0xAB);

  MemoryConnection reader(wire, Role::server(), 1024);
  auto event = reader.ws.recv();
  REQUIRE_FALSE(event.has_value());
  REQUIRE(event.get_error() == ErrorCode::kPayloadTooLarge);
  // Only the 2 + 8 header bytes were consumed
  REQUIRE(reader.state->pos == 10);
}

TEST_CASE("WebSocket - truncated frame reports the closed stream", "[websocket]") {
  std::vector<uint8_t> wire = {0x82, 0x05, 1, 2};
  MemoryConnection reader(wire, Role::server());
  auto event = reader.ws.recv();
  REQUIRE_FALSE(event.has_value());
  REQUIRE(event.get_error() == ErrorCode::kConnectionClosed);
  REQUIRE(reader.ws.is_closed());
}

// ============================================================================
// Close handshake
// ============================================================================

TEST_CASE("WebSocket - close frame with code and reason", "[websocket]") {
  std::vector<uint8_t> payload = {0x03, 0xE9};  // 1001
  std::string reason = "bye";
  payload.insert(payload.end(), reason.begin(), reason.end());

  MemoryConnection reader(raw_frame(0x88, payload, kKey), Role::server());
  auto event = reader.ws.recv();
  REQUIRE(event.has_value());
  REQUIRE(event.value().is_close());
  REQUIRE(event.value().code == 1001);
  REQUIRE(event.value().reason == "bye");
  REQUIRE(reader.ws.is_closed());
}

TEST_CASE("WebSocket - close payload shorter than 2 bytes means 1000", "[websocket]") {
  for (std::vector<uint8_t> payload : {std::vector<uint8_t>{}, std::vector<uint8_t>{0x03}}) {
    MemoryConnection reader(raw_frame(0x88, payload), Role::client(true));
    auto event = reader.ws.recv();
    REQUIRE(event.has_value());
    REQUIRE(event.value().code == ws::kCloseNormal);
    REQUIRE(event.value().reason.empty());
  }
}

TEST_CASE("WebSocket - close codes are validated", "[websocket]") {
  MemoryConnection accepted(raw_frame(0x88, {0x0F, 0xA0}), Role::server());  // 4000
  auto ok = accepted.ws.recv();
  REQUIRE(ok.has_value());
  REQUIRE(ok.value().code == 4000);

  for (uint16_t code : {uint16_t(999), uint16_t(1005), uint16_t(1016), uint16_t(2999), uint16_t(5000)}) {
    std::vector<uint8_t> payload = {static_cast<uint8_t>(code >> 8), static_cast<uint8_t>(code & 0xFF)};
    MemoryConnection reader(raw_frame(0x88, payload), Role::server());
    auto event = reader.ws.recv();
    REQUIRE_FALSE(event.has_value());
    REQUIRE(event.get_error() == ErrorCode::kInvalidCloseCode);
  }
}

TEST_CASE("WebSocket - close reason must be UTF-8", "[websocket]") {
  MemoryConnection reader(raw_frame(0x88, {0x03, 0xE8, 0xC3, 0x28}), Role::server());
  auto event = reader.ws.recv();
  REQUIRE_FALSE(event.has_value());
  REQUIRE(event.get_error() == ErrorCode::kInvalidUtf8);
}

TEST_CASE("WebSocket - recv after close does not touch the stream", "[websocket]") {
  auto wire = raw_frame(0x88, {0x03, 0xE8});
  auto trailing = raw_frame(0x82, {1, 2, 3});
  wire.insert(wire.end(), trailing.begin(), trailing.end());

  MemoryConnection reader(wire, Role::server());
  REQUIRE(reader.ws.recv().has_value());
  size_t reads = reader.state->read_calls;
  size_t pos = reader.state->pos;

  auto again = reader.ws.recv();
  REQUIRE_FALSE(again.has_value());
  REQUIRE(again.get_error() == ErrorCode::kReadAfterClose);
  REQUIRE(reader.state->read_calls == reads);
  REQUIRE(reader.state->pos == pos);
}

TEST_CASE("WebSocket - recv after a decode error fails without reading", "[websocket]") {
  MemoryConnection reader(raw_frame(0xC2, {1}), Role::server());
  REQUIRE_FALSE(reader.ws.recv().has_value());
  size_t reads = reader.state->read_calls;

  auto again = reader.ws.recv();
  REQUIRE(again.get_error() == ErrorCode::kReadAfterClose);
  REQUIRE(reader.state->read_calls == reads);
}

TEST_CASE("WebSocket - close() sends code and reason then closes", "[websocket]") {
  MemoryConnection conn({}, Role::server());
  REQUIRE(conn.ws.close(ws::kCloseGoingAway, "shutdown").has_value());
  REQUIRE(conn.ws.is_closed());

  const auto& out = conn.state->output;
  REQUIRE(out.size() == 2 + 2 + 8);
  REQUIRE(out[0] == 0x88);
  REQUIRE(out[1] == 10);
  REQUIRE(ws::read_be16(out.data() + 2) == 1001);
  REQUIRE(std::string(out.begin() + 4, out.end()) == "shutdown");

  auto sent = conn.ws.send(Frame::binary(out.data(), 1));
  REQUIRE_FALSE(sent.has_value());
  REQUIRE(sent.get_error() == ErrorCode::kConnectionClosed);
}

TEST_CASE("WebSocket - close() truncates an overlong reason", "[websocket]") {
  MemoryConnection conn({}, Role::server());
  REQUIRE(conn.ws.close(ws::kCloseNormal, std::string(300, 'r')).has_value());
  REQUIRE(conn.state->output.size() == 2 + ws::kMaxControlPayload);
}

// ============================================================================
// Failure propagation and split
// ============================================================================

TEST_CASE("WebSocket - failed send closes the connection", "[websocket]") {
  MemoryConnection conn({}, Role::client(true));
  conn.state->fail_writes = true;
  uint8_t byte = 1;
  auto sent = conn.ws.send(Frame::binary(&byte, 1));
  REQUIRE_FALSE(sent.has_value());
  REQUIRE(sent.get_error() == ErrorCode::kSocketError);
  REQUIRE(conn.ws.is_closed());
  REQUIRE(conn.state->shut);
}

TEST_CASE("WebSocket - split halves share the closed flag", "[websocket]") {
  MemoryConnection conn(raw_frame(0x88, {}), Role::server());
  auto halves = WebSocket::split(std::move(conn.ws));
  REQUIRE(halves.has_value());
  WebSocket& reader = halves.value().first;
  WebSocket& writer = halves.value().second;

  uint8_t byte = 7;
  REQUIRE(writer.send(Frame::binary(&byte, 1)).has_value());
  REQUIRE(conn.state->output.size() == 3);

  auto event = reader.recv();
  REQUIRE(event.has_value());
  REQUIRE(event.value().is_close());
  REQUIRE(writer.is_closed());
  REQUIRE_FALSE(writer.send(Frame::binary(&byte, 1)).has_value());
}
