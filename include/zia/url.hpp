#ifndef ZIA_URL_HPP_
#define ZIA_URL_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>

namespace zia {

// ============================================================================
// Url - scheme://host[:port][/path]
// ============================================================================

struct Url {
  std::string scheme;    // lower case
  std::string userinfo;  // "user:password" before '@', if any
  std::string host;      // brackets stripped from IPv6 literals
  uint16_t port = 0;
  std::string path = "/";

  bool is_tls() const { return scheme == "wss"; }
  bool is_ipv6() const { return host.find(':') != std::string::npos; }

  // host:port, as used in Host and CONNECT lines
  std::string authority() const;

  std::string to_string() const;
};

// Known schemes and their default ports: ws (80), wss (443), http (80).
// tcp and udp have no default; the port is required.
expected<Url, ErrorCode> parse_url(std::string_view text);

// Parses "host:port" (no scheme). Used for listen and upstream addresses.
expected<Url, ErrorCode> parse_host_port(std::string_view text);

// Decodes %XX escapes, as found in URL userinfo. Malformed escapes are kept
// as written.
std::string percent_decode(std::string_view text);

}  // namespace zia

#endif  // ZIA_URL_HPP_
