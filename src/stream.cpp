#include "zia/stream.hpp"

#include "zia/log.hpp"

#include <cerrno>
#include <cstring>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace zia {

// ============================================================================
// ByteStream
// ============================================================================

expected<void, ErrorCode> ByteStream::read_exact(uint8_t* buf, size_t len) {
  size_t got = 0;
  while (got < len) {
    auto n = read_some(buf + got, len - got);
    if (!n.has_value()) {
      return expected<void, ErrorCode>::error(n.get_error());
    }
    got += n.value();
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> ByteStream::write_vectored(const struct iovec* iov, size_t count) {
  for (size_t i = 0; i < count; ++i) {
    auto result = write_all(static_cast<const uint8_t*>(iov[i].iov_base), iov[i].iov_len);
    if (!result.has_value()) {
      return result;
    }
  }
  return expected<void, ErrorCode>::success();
}

// ============================================================================
// TcpStream
// ============================================================================

TcpStream::TcpStream(sockpp::tcp_socket&& sock) : socket_(std::move(sock)) {}

TcpStream::~TcpStream() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

expected<size_t, ErrorCode> TcpStream::read_some(uint8_t* buf, size_t len) {
  while (true) {
    ssize_t n = ::recv(socket_.handle(), buf, len, 0);
    if (n > 0) {
      return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
    }
    if (n == 0) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
    int err = errno;
    if (err == EINTR) {
      continue;
    }
    ZIA_LOG_DEBUG("TCP read error: " + std::string(strerror(err)));
    return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
  }
}

expected<void, ErrorCode> TcpStream::write_all(const uint8_t* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::send(socket_.handle(), data + sent, len - sent, MSG_NOSIGNAL);
    if (n < 0) {
      int err = errno;
      if (err == EINTR) {
        continue;
      }
      ZIA_LOG_DEBUG("TCP write error: " + std::string(strerror(err)));
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
    sent += static_cast<size_t>(n);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> TcpStream::write_vectored(const struct iovec* iov, size_t count) {
  // Local copy: partial writes advance the segments in place
  std::vector<struct iovec> segs(iov, iov + count);
  size_t idx = 0;

  while (idx < segs.size()) {
    struct msghdr msg;
    std::memset(&msg, 0, sizeof(msg));
    msg.msg_iov = segs.data() + idx;
    msg.msg_iovlen = segs.size() - idx;

    ssize_t n = ::sendmsg(socket_.handle(), &msg, MSG_NOSIGNAL);
    if (n < 0) {
      int err = errno;
      if (err == EINTR) {
        continue;
      }
      ZIA_LOG_DEBUG("TCP sendmsg error: " + std::string(strerror(err)));
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }

    size_t written = static_cast<size_t>(n);
    while (idx < segs.size() && written >= segs[idx].iov_len) {
      written -= segs[idx].iov_len;
      ++idx;
    }
    if (idx < segs.size() && written > 0) {
      segs[idx].iov_base = static_cast<uint8_t*>(segs[idx].iov_base) + written;
      segs[idx].iov_len -= written;
    }
  }
  return expected<void, ErrorCode>::success();
}

expected<std::unique_ptr<ByteStream>, ErrorCode> TcpStream::clone() {
  int fd = ::dup(socket_.handle());
  if (fd < 0) {
    ZIA_LOG_ERROR("Unable to duplicate socket: " + std::string(strerror(errno)));
    return expected<std::unique_ptr<ByteStream>, ErrorCode>::error(ErrorCode::kSocketError);
  }
  std::unique_ptr<ByteStream> copy = std::make_unique<TcpStream>(sockpp::tcp_socket(fd));
  return expected<std::unique_ptr<ByteStream>, ErrorCode>::success(std::move(copy));
}

void TcpStream::shutdown() {
  if (socket_.is_open()) {
    socket_.shutdown(SHUT_RDWR);
  }
}

void TcpStream::close() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

void set_tcp_nodelay(sockpp::tcp_socket& sock) {
  int opt = 1;
  if (!sock.set_option(IPPROTO_TCP, TCP_NODELAY, opt)) {
    ZIA_LOG_WARN("Unable to set TCP_NODELAY: " + sock.last_error_str());
  }
}

}  // namespace zia
