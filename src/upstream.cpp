#include "zia/upstream.hpp"

#include "zia/handshake.hpp"
#include "zia/log.hpp"
#include "zia/utils.hpp"

#include <exception>
#include <sockpp/inet_address.h>
#include <sockpp/tcp_connector.h>
#include <utility>

namespace zia {

expected<sockpp::tcp_socket, ErrorCode> connect_tcp(const std::string& host, uint16_t port) {
  using Result = expected<sockpp::tcp_socket, ErrorCode>;

  sockpp::inet_address addr;
  try {
    addr = sockpp::inet_address(host, port);
  } catch (const std::exception& e) {
    ZIA_LOG_ERROR("Unable to resolve " + host + ": " + e.what());
    return Result::error(ErrorCode::kResolveFailed);
  }

  sockpp::tcp_connector conn;
  if (!conn.connect(addr)) {
    ZIA_LOG_ERROR("Unable to connect to " + addr.to_string() + ": " + conn.last_error_str());
    return Result::error(ErrorCode::kSocketError);
  }

  sockpp::tcp_socket sock(conn.release());
  set_tcp_nodelay(sock);
  return Result::success(std::move(sock));
}

expected<void, ErrorCode> proxy_connect(ByteStream& stream, const Url& target, const Url& proxy) {
  std::string req;
  req.reserve(256);
  req += "CONNECT " + target.authority() + " HTTP/1.1\r\n";
  req += "Host: " + target.authority() + "\r\n";
  if (!proxy.userinfo.empty()) {
    std::string credentials = percent_decode(proxy.userinfo);
    req += "Proxy-Authorization: Basic " +
           Base64::encode(reinterpret_cast<const uint8_t*>(credentials.data()), credentials.size()) + "\r\n";
  }
  req += "\r\n";

  auto sent = stream.write_all(reinterpret_cast<const uint8_t*>(req.data()), req.size());
  if (!sent.has_value()) {
    return sent;
  }

  auto head = read_http_head(stream);
  if (!head.has_value()) {
    ZIA_LOG_ERROR("Proxy " + proxy.authority() + " closed the connection during CONNECT");
    return expected<void, ErrorCode>::error(ErrorCode::kProxyFailed);
  }

  int status = parse_status_code(head.value());
  if (status < 200 || status > 299) {
    ZIA_LOG_ERROR("Proxy " + proxy.authority() + " refused CONNECT to " + target.authority() + " (status " +
                  std::to_string(status) + ")");
    return expected<void, ErrorCode>::error(ErrorCode::kProxyFailed);
  }
  return expected<void, ErrorCode>::success();
}

expected<std::unique_ptr<ByteStream>, ErrorCode> connect_upstream(const Url& target, const Url* proxy,
                                                                  const std::shared_ptr<TlsContext>& tls) {
  using Result = expected<std::unique_ptr<ByteStream>, ErrorCode>;

  const Url& hop = proxy != nullptr ? *proxy : target;
  auto sock = connect_tcp(hop.host, hop.port);
  if (!sock.has_value()) {
    return Result::error(sock.get_error());
  }

  if (proxy != nullptr) {
    TcpStream tunnel(std::move(sock.value()));
    auto tunneled = proxy_connect(tunnel, target, *proxy);
    if (!tunneled.has_value()) {
      return Result::error(tunneled.get_error());
    }
    sock = expected<sockpp::tcp_socket, ErrorCode>::success(sockpp::tcp_socket(tunnel.socket().release()));
  }

  if (!target.is_tls()) {
    return Result::success(std::unique_ptr<ByteStream>(std::make_unique<TcpStream>(std::move(sock.value()))));
  }

#ifdef ZIA_WITH_TLS
  if (!tls) {
    ZIA_LOG_ERROR("wss:// upstream without a TLS context");
    return Result::error(ErrorCode::kTlsError);
  }
  auto secured = TlsStream::connect(std::move(sock.value()), tls, target.host);
  if (!secured.has_value()) {
    return Result::error(secured.get_error());
  }
  return Result::success(std::unique_ptr<ByteStream>(secured.value().release()));
#else
  (void)tls;
  ZIA_LOG_ERROR("wss:// requires a build with ZIA_WITH_TLS");
  return Result::error(ErrorCode::kTlsError);
#endif
}

}  // namespace zia
