#ifndef ZIA_CONFIG_HPP_
#define ZIA_CONFIG_HPP_

#include "log.hpp"
#include "tls.hpp"
#include "url.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>

namespace zia {

static constexpr const char* kVersion = "0.1.0";

// ============================================================================
// Listener modes (server)
// ============================================================================

enum class ListenerMode : uint8_t {
  kWebSocket,    // "ws": RFC 6455 framed, one binary message per datagram
  kPassThrough,  // "tcp": raw stream bytes, one read per datagram
};

inline const char* to_string(ListenerMode mode) {
  switch (mode) {
    case ListenerMode::kWebSocket:
      return "ws";
    case ListenerMode::kPassThrough:
      return "tcp";
  }
  return "unknown";
}

bool parse_listener_mode(const std::string& text, ListenerMode& out);

// ============================================================================
// Process configuration
// ============================================================================
//
// Every option falls back to a ZIA_* environment variable, then to its
// default. Values are validated during parsing.

struct ClientConfig {
  Url listen_addr;   // UDP, host:port
  Url upstream;      // ws:// or wss://
  bool has_proxy = false;
  Url proxy;         // http://
  size_t connections = 8;
  TlsOptions tls;
  Logger::Level log_level = Logger::Level::kInfo;
};

struct ServerConfig {
  Url listen_addr;  // TCP, host:port
  Url upstream;     // UDP, host:port
  ListenerMode mode = ListenerMode::kWebSocket;
  Logger::Level log_level = Logger::Level::kInfo;
};

// Returns nothing when the process should exit instead of running (help,
// version, invalid arguments); exit_code then holds its status.
optional<ClientConfig> parse_client_config(int argc, const char* const* argv, int& exit_code);

optional<ServerConfig> parse_server_config(int argc, const char* const* argv, int& exit_code);

}  // namespace zia

#endif  // ZIA_CONFIG_HPP_
