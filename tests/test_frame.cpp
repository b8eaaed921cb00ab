#include "zia.hpp"

#include <cstring>

#include <catch2/catch_test_macros.hpp>

using namespace zia;

// ============================================================================
// Frame Header Encoding
// ============================================================================

TEST_CASE("Frame header - short binary frame", "[frame]") {
  uint8_t buf[ws::kMaxHeaderSize];
  size_t len = ws::encode_frame_header(buf, ws::OpCode::kBinary, 5);
  REQUIRE(len == 2);
  REQUIRE(buf[0] == 0x82);  // FIN + binary
  REQUIRE(buf[1] == 0x05);
}

TEST_CASE("Frame header - 125 bytes still fits in 7 bits", "[frame]") {
  uint8_t buf[ws::kMaxHeaderSize];
  size_t len = ws::encode_frame_header(buf, ws::OpCode::kBinary, 125);
  REQUIRE(len == 2);
  REQUIRE(buf[1] == 125);
}

TEST_CASE("Frame header - 16-bit extended length", "[frame]") {
  uint8_t buf[ws::kMaxHeaderSize];
  size_t len = ws::encode_frame_header(buf, ws::OpCode::kBinary, 126);
  REQUIRE(len == 4);
  REQUIRE(buf[1] == ws::kLen16);
  REQUIRE(ws::read_be16(buf + 2) == 126);

  len = ws::encode_frame_header(buf, ws::OpCode::kBinary, 65535);
  REQUIRE(len == 4);
  REQUIRE(ws::read_be16(buf + 2) == 65535);
}

TEST_CASE("Frame header - 64-bit extended length", "[frame]") {
  uint8_t buf[ws::kMaxHeaderSize];
  size_t len = ws::encode_frame_header(buf, ws::OpCode::kBinary, 65536);
  REQUIRE(len == 10);
  REQUIRE(buf[1] == ws::kLen64);
  REQUIRE(ws::read_be64(buf + 2) == 65536);
}

TEST_CASE("Frame header - mask key follows the length", "[frame]") {
  uint8_t buf[ws::kMaxHeaderSize];
  const uint8_t key[4] = {0x37, 0xfa, 0x21, 0x3d};
  size_t len = ws::encode_frame_header(buf, ws::OpCode::kBinary, 300, true, key);
  REQUIRE(len == 8);
  REQUIRE((buf[1] & ws::kMaskBit) != 0);
  REQUIRE((buf[1] & ws::kLenBits) == ws::kLen16);
  REQUIRE(std::memcmp(buf + 4, key, 4) == 0);
}

TEST_CASE("Frame header - close opcode", "[frame]") {
  uint8_t buf[ws::kMaxHeaderSize];
  ws::encode_frame_header(buf, ws::OpCode::kClose, 2);
  REQUIRE(buf[0] == 0x88);
}

// ============================================================================
// Masking
// ============================================================================

TEST_CASE("Mask - RFC 6455 sample", "[frame]") {
  // "Hello" masked with 0x37fa213d (RFC 6455 section 5.7)
  uint8_t payload[] = {0x7f, 0x9f, 0x4d, 0x51, 0x58};
  const uint8_t key[4] = {0x37, 0xfa, 0x21, 0x3d};
  ws::apply_mask(payload, sizeof(payload), key);
  REQUIRE(std::memcmp(payload, "Hello", 5) == 0);
}

TEST_CASE("Mask - applying twice restores the input", "[frame]") {
  uint8_t data[9] = {1, 2, 3, 4, 5, 6, 7, 8, 9};
  const uint8_t key[4] = {0xAA, 0x55, 0x0F, 0xF0};
  ws::apply_mask(data, sizeof(data), key);
  REQUIRE(data[0] == (1 ^ 0xAA));
  REQUIRE(data[4] == (5 ^ 0xAA));
  ws::apply_mask(data, sizeof(data), key);
  for (uint8_t i = 0; i < 9; ++i) {
    REQUIRE(data[i] == i + 1);
  }
}

// ============================================================================
// Close codes
// ============================================================================

TEST_CASE("Close code - accepted ranges", "[frame]") {
  for (uint16_t code : {1000, 1001, 1002, 1003, 1007, 1008, 1009, 1010, 1011, 1015, 3000, 3999, 4000, 4999}) {
    REQUIRE(ws::is_valid_close_code(code));
  }
}

TEST_CASE("Close code - rejected values", "[frame]") {
  for (uint16_t code : {0, 999, 1004, 1005, 1006, 1012, 1014, 1016, 2999, 5000, 65535}) {
    REQUIRE_FALSE(ws::is_valid_close_code(code));
  }
}

// ============================================================================
// Role
// ============================================================================

TEST_CASE("Role - server never masks", "[frame]") {
  Role role = Role::server();
  REQUIRE(role.is_server());
  REQUIRE_FALSE(role.masking);

  Role client = Role::client(true);
  REQUIRE(client.is_client());
  REQUIRE(client.masking);
}
