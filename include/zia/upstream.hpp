#ifndef ZIA_UPSTREAM_HPP_
#define ZIA_UPSTREAM_HPP_

#include "stream.hpp"
#include "tls.hpp"
#include "url.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <sockpp/tcp_socket.h>
#include <string>

namespace zia {

// ============================================================================
// Upstream connection setup
// ============================================================================

// Resolves host and connects. TCP_NODELAY is set on success.
expected<sockpp::tcp_socket, ErrorCode> connect_tcp(const std::string& host, uint16_t port);

// Asks an HTTP proxy to open a tunnel to target (CONNECT host:port).
// Credentials in the proxy URL go out as Basic Proxy-Authorization.
expected<void, ErrorCode> proxy_connect(ByteStream& stream, const Url& target, const Url& proxy);

// Byte stream to target, directly or through proxy (may be null), wrapped in
// TLS when target is wss://. tls is required for wss:// only.
expected<std::unique_ptr<ByteStream>, ErrorCode> connect_upstream(const Url& target, const Url* proxy,
                                                                  const std::shared_ptr<TlsContext>& tls);

}  // namespace zia

#endif  // ZIA_UPSTREAM_HPP_
