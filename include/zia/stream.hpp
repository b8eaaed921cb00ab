#ifndef ZIA_STREAM_HPP_
#define ZIA_STREAM_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <memory>
#include <sockpp/tcp_socket.h>
#include <sys/uio.h>

namespace zia {

// ============================================================================
// ByteStream (abstract duplex byte stream under the frame codec)
// ============================================================================

class ByteStream {
 public:
  virtual ~ByteStream() = default;

  // Reads between 1 and len bytes.
  // Returns error(kConnectionClosed) on EOF, error(kSocketError) on failure.
  virtual expected<size_t, ErrorCode> read_some(uint8_t* buf, size_t len) = 0;

  // Writes the whole buffer or fails.
  virtual expected<void, ErrorCode> write_all(const uint8_t* data, size_t len) = 0;

  // Scatter/gather write. The default writes each segment with write_all().
  virtual expected<void, ErrorCode> write_vectored(const struct iovec* iov, size_t count);

  // Independent handle on the same underlying connection. Reads go through
  // one handle and writes through the other.
  virtual expected<std::unique_ptr<ByteStream>, ErrorCode> clone() = 0;

  // Disables both directions; unblocks a reader waiting on any handle.
  virtual void shutdown() = 0;

  virtual void close() = 0;

  // Reads exactly len bytes; EOF before that is error(kConnectionClosed).
  expected<void, ErrorCode> read_exact(uint8_t* buf, size_t len);
};

// ============================================================================
// TcpStream (sockpp TCP socket)
// ============================================================================

class TcpStream : public ByteStream {
 public:
  explicit TcpStream(sockpp::tcp_socket&& sock);
  ~TcpStream() override;

  expected<size_t, ErrorCode> read_some(uint8_t* buf, size_t len) override;
  expected<void, ErrorCode> write_all(const uint8_t* data, size_t len) override;
  expected<void, ErrorCode> write_vectored(const struct iovec* iov, size_t count) override;
  expected<std::unique_ptr<ByteStream>, ErrorCode> clone() override;
  void shutdown() override;
  void close() override;

  int get_fd() const { return socket_.handle(); }

  sockpp::tcp_socket& socket() { return socket_; }

 private:
  sockpp::tcp_socket socket_;
};

// Disables Nagle on a freshly connected or accepted socket.
void set_tcp_nodelay(sockpp::tcp_socket& sock);

}  // namespace zia

#endif  // ZIA_STREAM_HPP_
