/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file vocabulary.hpp
 * @brief Vocabulary types for zia: ErrorCode, expected, optional.
 *
 * Derived from newosp vocabulary (iceoryx inspired).
 */

#ifndef ZIA_VOCABULARY_HPP_
#define ZIA_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <new>
#include <utility>

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define ZIA_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define ZIA_THROW(ex)             \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

// Assertion macro (no-op in release)
#ifndef ZIA_ASSERT
#define ZIA_ASSERT(cond) ((void)(cond))
#endif

namespace zia {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,

  // Transport
  kSocketError = 1,
  kConnectionClosed = 2,
  kTimeout = 3,
  kResolveFailed = 4,
  kTlsError = 5,

  // Frame codec
  kReadAfterClose = 10,
  kReservedBitsSet = 11,
  kUnexpectedMask = 12,
  kFragmentedControl = 13,
  kControlFrameTooLong = 14,
  kUnknownOpcode = 15,
  kInvalidDataFrame = 16,
  kPayloadTooLarge = 17,
  kInvalidCloseCode = 18,
  kInvalidUtf8 = 19,

  // Connection setup
  kHandshakeFailed = 20,
  kProxyFailed = 21,
  kInvalidUrl = 22,

  kInvalidState = 30,
  kInternalError = 255
};

// Human readable description of an error code.
inline const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kSocketError: return "socket error";
    case ErrorCode::kConnectionClosed: return "connection closed";
    case ErrorCode::kTimeout: return "timed out";
    case ErrorCode::kResolveFailed: return "unable to resolve host";
    case ErrorCode::kTlsError: return "tls error";
    case ErrorCode::kReadAfterClose: return "read after close";
    case ErrorCode::kReservedBitsSet: return "reserve bit must be `0`";
    case ErrorCode::kUnexpectedMask: return "expected unmasked frame";
    case ErrorCode::kFragmentedControl: return "control frame must not be fragmented";
    case ErrorCode::kControlFrameTooLong:
      return "control frame must have a payload length of 125 bytes or less";
    case ErrorCode::kUnknownOpcode: return "unknown opcode";
    case ErrorCode::kInvalidDataFrame: return "invalid data frame";
    case ErrorCode::kPayloadTooLarge: return "payload too large";
    case ErrorCode::kInvalidCloseCode: return "invalid close code";
    case ErrorCode::kInvalidUtf8: return "invalid utf-8 payload";
    case ErrorCode::kHandshakeFailed: return "websocket handshake failed";
    case ErrorCode::kProxyFailed: return "proxy negotiation failed";
    case ErrorCode::kInvalidUrl: return "invalid url";
    case ErrorCode::kInvalidState: return "invalid state";
    case ErrorCode::kInternalError: return "internal error";
  }
  return "unknown error";
}

namespace detail {

// Raw storage for an optionally constructed T. The owner tracks liveness.
template <typename T>
class Slot {
 public:
  template <typename... Args>
  void emplace(Args&&... args) noexcept {
    ::new (static_cast<void*>(&raw_)) T(std::forward<Args>(args)...);
  }

  void destroy() noexcept { get().~T(); }

  T& get() noexcept { return *std::launder(reinterpret_cast<T*>(&raw_)); }
  const T& get() const noexcept { return *std::launder(reinterpret_cast<const T*>(&raw_)); }

 private:
  alignas(T) unsigned char raw_[sizeof(T)];
};

}  // namespace detail

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Either a value V or an error E, built with success() / error().
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) noexcept {
    expected e;
    e.slot_.emplace(val);
    e.has_value_ = true;
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.slot_.emplace(std::move(val));
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) noexcept { assign(other); }
  expected(expected&& other) noexcept { assign(std::move(other)); }

  expected& operator=(const expected& other) noexcept {
    if (this != &other) {
      clear();
      assign(other);
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      clear();
      assign(std::move(other));
    }
    return *this;
  }

  ~expected() { clear(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    ZIA_ASSERT(has_value_);
    return slot_.get();
  }

  const V& value() const& noexcept {
    ZIA_ASSERT(has_value_);
    return slot_.get();
  }

  E get_error() const noexcept {
    ZIA_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const noexcept { return has_value_ ? slot_.get() : fallback; }

 private:
  expected() noexcept = default;

  void assign(const expected& other) noexcept {
    err_ = other.err_;
    if (other.has_value_) slot_.emplace(other.slot_.get());
    has_value_ = other.has_value_;
  }

  void assign(expected&& other) noexcept {
    err_ = other.err_;
    if (other.has_value_) slot_.emplace(std::move(other.slot_.get()));
    has_value_ = other.has_value_;
  }

  void clear() noexcept {
    if (has_value_) slot_.destroy();
    has_value_ = false;
  }

  detail::Slot<V> slot_;
  E err_{};
  bool has_value_ = false;
};

// Success or an error, no value.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) noexcept { return expected(false, err); }

  [[nodiscard]] bool has_value() const noexcept { return ok_; }
  explicit operator bool() const noexcept { return ok_; }

  E get_error() const noexcept {
    ZIA_ASSERT(!ok_);
    return err_;
  }

 private:
  expected(bool ok, E err) noexcept : err_(err), ok_(ok) {}

  E err_;
  bool ok_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept = default;

  optional(const T& val) noexcept { emplace(val); }        // NOLINT
  optional(T&& val) noexcept { emplace(std::move(val)); }  // NOLINT

  optional(const optional& other) noexcept {
    if (other.engaged_) emplace(other.slot_.get());
  }

  optional(optional&& other) noexcept {
    if (other.engaged_) emplace(std::move(other.slot_.get()));
  }

  optional& operator=(const optional& other) noexcept {
    if (this != &other) {
      reset();
      if (other.engaged_) emplace(other.slot_.get());
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      if (other.engaged_) emplace(std::move(other.slot_.get()));
    }
    return *this;
  }

  ~optional() { reset(); }

  [[nodiscard]] bool has_value() const noexcept { return engaged_; }
  explicit operator bool() const noexcept { return engaged_; }

  T& value() noexcept {
    ZIA_ASSERT(engaged_);
    return slot_.get();
  }

  const T& value() const noexcept {
    ZIA_ASSERT(engaged_);
    return slot_.get();
  }

  T* operator->() noexcept { return &value(); }
  const T* operator->() const noexcept { return &value(); }

  T value_or(const T& fallback) const noexcept { return engaged_ ? slot_.get() : fallback; }

  void reset() noexcept {
    if (engaged_) {
      slot_.destroy();
      engaged_ = false;
    }
  }

 private:
  template <typename U>
  void emplace(U&& val) noexcept {
    slot_.emplace(std::forward<U>(val));
    engaged_ = true;
  }

  detail::Slot<T> slot_;
  bool engaged_ = false;
};

}  // namespace zia

#endif  // ZIA_VOCABULARY_HPP_
