/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Encoding helpers used by the WebSocket handshake and frame codec:
 * Base64, SHA-1, UTF-8 validation and the masking key source.
 */

#ifndef ZIA_UTILS_HPP_
#define ZIA_UTILS_HPP_

#include <cstddef>
#include <cstdint>

#include <algorithm>
#include <array>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace zia {

// ============================================================================
// Base64 encoding/decoding
// ============================================================================

class Base64 {
 public:
  static std::string encode(const uint8_t* data, size_t size) {
    static constexpr const char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out((size + 2) / 3 * 4, '=');
    size_t o = 0;
    size_t whole = size - size % 3;
    for (size_t i = 0; i < whole; i += 3) {
      uint32_t group = (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8) | data[i + 2];
      for (int shift = 18; shift >= 0; shift -= 6) {
        out[o++] = kAlphabet[(group >> shift) & 0x3F];
      }
    }
    // One or two trailing bytes; the rest of the quantum stays '='
    size_t tail = size - whole;
    if (tail != 0) {
      uint32_t group = uint32_t{data[whole]} << 16;
      if (tail == 2) group |= uint32_t{data[whole + 1]} << 8;
      out[o++] = kAlphabet[(group >> 18) & 0x3F];
      out[o++] = kAlphabet[(group >> 12) & 0x3F];
      if (tail == 2) out[o] = kAlphabet[(group >> 6) & 0x3F];
    }
    return out;
  }

  // Returns an empty vector if the input is not well-formed Base64.
  static std::vector<uint8_t> decode(std::string_view encoded) {
    std::vector<uint8_t> result;
    if (encoded.size() % 4 != 0) return result;
    result.reserve(encoded.size() / 4 * 3);

    for (size_t i = 0; i < encoded.size(); i += 4) {
      bool last = (i + 4 == encoded.size());
      int v0 = value_of(encoded[i]);
      int v1 = value_of(encoded[i + 1]);
      int v2 = (last && encoded[i + 2] == '=') ? -2 : value_of(encoded[i + 2]);
      int v3 = (last && encoded[i + 3] == '=') ? -2 : value_of(encoded[i + 3]);
      if (v0 < 0 || v1 < 0 || v2 == -1 || v3 == -1 || (v2 == -2 && v3 != -2)) {
        return {};
      }

      uint32_t b = (static_cast<uint32_t>(v0) << 18) | (static_cast<uint32_t>(v1) << 12);
      result.push_back(static_cast<uint8_t>((b >> 16) & 0xFF));
      if (v2 >= 0) {
        b |= static_cast<uint32_t>(v2) << 6;
        result.push_back(static_cast<uint8_t>((b >> 8) & 0xFF));
      }
      if (v3 >= 0) {
        b |= static_cast<uint32_t>(v3);
        result.push_back(static_cast<uint8_t>(b & 0xFF));
      }
    }
    return result;
  }

 private:
  static int value_of(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
  }
};

// ============================================================================
// SHA-1 hashing (for WebSocket accept key generation)
// ============================================================================

class SHA1 {
 public:
  using Digest = std::array<uint8_t, 20>;

  static Digest compute(const uint8_t* data, size_t size) {
    SHA1 sha1;
    sha1.update(data, size);
    return sha1.finalize();
  }

  static std::string hex_digest(std::string_view input) {
    static constexpr const char kHex[] = "0123456789abcdef";
    Digest digest = compute(reinterpret_cast<const uint8_t*>(input.data()), input.size());
    std::string hex(digest.size() * 2, '0');
    for (size_t i = 0; i < digest.size(); ++i) {
      hex[2 * i] = kHex[digest[i] >> 4];
      hex[2 * i + 1] = kHex[digest[i] & 0x0F];
    }
    return hex;
  }

  void update(const uint8_t* data, size_t size) {
    length_ += size;
    // Top up a partial block first, then hash whole blocks in place
    if (pending_ != 0) {
      size_t take = std::min(size, kBlock - pending_);
      std::copy(data, data + take, block_.begin() + pending_);
      pending_ += take;
      data += take;
      size -= take;
      if (pending_ < kBlock) return;
      compress(block_.data());
      pending_ = 0;
    }
    for (; size >= kBlock; data += kBlock, size -= kBlock) {
      compress(data);
    }
    std::copy(data, data + size, block_.begin());
    pending_ = size;
  }

  Digest finalize() {
    uint64_t bits = length_ * 8;
    block_[pending_++] = 0x80;
    if (pending_ > kBlock - 8) {
      std::fill(block_.begin() + pending_, block_.end(), uint8_t{0});
      compress(block_.data());
      pending_ = 0;
    }
    std::fill(block_.begin() + pending_, block_.end() - 8, uint8_t{0});
    for (size_t i = 0; i < 8; ++i) {
      block_[kBlock - 1 - i] = static_cast<uint8_t>(bits >> (8 * i));
    }
    compress(block_.data());

    Digest digest;
    for (size_t i = 0; i < digest.size(); ++i) {
      digest[i] = static_cast<uint8_t>(state_[i / 4] >> (24 - 8 * (i % 4)));
    }
    return digest;
  }

 private:
  static constexpr size_t kBlock = 64;

  std::array<uint32_t, 5> state_ = {0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0};
  std::array<uint8_t, kBlock> block_{};
  size_t pending_ = 0;
  uint64_t length_ = 0;

  static uint32_t rotl(uint32_t x, unsigned n) { return (x << n) | (x >> (32 - n)); }

  void compress(const uint8_t* in) {
    std::array<uint32_t, 80> w;
    for (size_t t = 0; t < 16; ++t) {
      const uint8_t* p = in + 4 * t;
      w[t] = (uint32_t{p[0]} << 24) | (uint32_t{p[1]} << 16) | (uint32_t{p[2]} << 8) | p[3];
    }
    for (size_t t = 16; t < 80; ++t) {
      w[t] = rotl(w[t - 3] ^ w[t - 8] ^ w[t - 14] ^ w[t - 16], 1);
    }

    std::array<uint32_t, 5> v = state_;
    for (size_t t = 0; t < 80; ++t) {
      uint32_t f;
      uint32_t k;
      switch (t / 20) {
        case 0:
          f = (v[1] & v[2]) | (~v[1] & v[3]);
          k = 0x5A827999;
          break;
        case 1:
          f = v[1] ^ v[2] ^ v[3];
          k = 0x6ED9EBA1;
          break;
        case 2:
          f = (v[1] & v[2]) | (v[1] & v[3]) | (v[2] & v[3]);
          k = 0x8F1BBCDC;
          break;
        default:
          f = v[1] ^ v[2] ^ v[3];
          k = 0xCA62C1D6;
          break;
      }
      uint32_t next = rotl(v[0], 5) + f + v[4] + k + w[t];
      v[4] = v[3];
      v[3] = v[2];
      v[2] = rotl(v[1], 30);
      v[1] = v[0];
      v[0] = next;
    }
    for (size_t i = 0; i < state_.size(); ++i) {
      state_[i] += v[i];
    }
  }
};

// ============================================================================
// UTF-8 validation (close frame reasons)
// ============================================================================

// Rejects overlong encodings, surrogates and code points above U+10FFFF.
inline bool is_valid_utf8(const uint8_t* data, size_t size) {
  size_t i = 0;
  while (i < size) {
    uint8_t c = data[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t extra = 0;
    uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }

    if (i + extra >= size) return false;
    for (size_t j = 1; j <= extra; ++j) {
      uint8_t cc = data[i + j];
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }

    static constexpr uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[extra]) return false;
    if (cp > 0x10FFFF) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;

    i += extra + 1;
  }
  return true;
}

// ============================================================================
// Masking key source
// ============================================================================

// Fresh 32-bit value per call; one generator per thread.
inline uint32_t random_u32() {
  thread_local std::mt19937 engine{std::random_device{}()};
  return static_cast<uint32_t>(engine());
}

}  // namespace zia

#endif  // ZIA_UTILS_HPP_
