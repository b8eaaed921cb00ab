#include "zia/config.hpp"

#include <CLI/CLI.hpp>
#include <initializer_list>
#include <utility>
#include <vector>

namespace zia {

namespace {

CLI::Validator url_validator(std::initializer_list<const char*> schemes, const std::string& description) {
  std::vector<std::string> allowed(schemes.begin(), schemes.end());
  return CLI::Validator(
      [allowed](std::string& value) -> std::string {
        auto url = parse_url(value);
        if (!url.has_value()) {
          return "not a valid URL: " + value;
        }
        if (url.value().is_ipv6()) {
          return "IPv6 addresses are not supported: " + value;
        }
        for (const auto& scheme : allowed) {
          if (url.value().scheme == scheme) {
            return {};
          }
        }
        std::string expected_schemes;
        for (const auto& scheme : allowed) {
          expected_schemes += (expected_schemes.empty() ? "" : " or ") + scheme + "://";
        }
        return "URL must start with " + expected_schemes;
      },
      description);
}

CLI::Validator host_port_validator() {
  return CLI::Validator(
      [](std::string& value) -> std::string {
        auto addr = parse_host_port(value);
        if (!addr.has_value()) {
          return "expected host:port, got " + value;
        }
        if (addr.value().is_ipv6()) {
          return "IPv6 addresses are not supported: " + value;
        }
        return {};
      },
      "HOST:PORT");
}

CLI::Validator log_level_validator() {
  return CLI::Validator(
      [](std::string& value) -> std::string {
        Logger::Level level;
        if (!Logger::parse_level(value, level)) {
          return "log level must be debug | info | warn | error";
        }
        return {};
      },
      "LEVEL");
}

CLI::Validator mode_validator() {
  return CLI::Validator(
      [](std::string& value) -> std::string {
        ListenerMode mode;
        if (!parse_listener_mode(value, mode)) {
          return "mode must be ws or tcp";
        }
        return {};
      },
      "MODE");
}

Logger::Level to_level(const std::string& text) {
  Logger::Level level = Logger::Level::kInfo;
  Logger::parse_level(text, level);
  return level;
}

}  // namespace

bool parse_listener_mode(const std::string& text, ListenerMode& out) {
  if (text == "ws") {
    out = ListenerMode::kWebSocket;
  } else if (text == "tcp") {
    out = ListenerMode::kPassThrough;
  } else {
    return false;
  }
  return true;
}

optional<ClientConfig> parse_client_config(int argc, const char* const* argv, int& exit_code) {
  CLI::App app{"zia-client - tunnels UDP datagrams over WebSocket connections"};
  app.set_version_flag("-V,--version", kVersion);

  std::string listen = "127.0.0.1:8080";
  std::string upstream;
  std::string proxy;
  size_t connections = 8;
  std::string ca_file = kDefaultCaFile;
  bool insecure = false;
  std::string log_level = "info";

  app.add_option("-l,--listen-addr", listen, "UDP address to accept datagrams on")
      ->envname("ZIA_LISTEN_ADDR")
      ->check(host_port_validator())
      ->capture_default_str();
  app.add_option("-u,--upstream", upstream, "Server to tunnel to (ws:// or wss://)")
      ->envname("ZIA_UPSTREAM")
      ->required()
      ->check(url_validator({"ws", "wss"}, "URL"));
  app.add_option("-p,--proxy", proxy, "HTTP proxy to reach the upstream through (http://)")
      ->envname("ZIA_PROXY")
      ->check(url_validator({"http"}, "URL"));
  app.add_option("-c,--connections", connections, "Number of upstream WebSocket connections")
      ->envname("ZIA_CONNECTIONS")
      ->check(CLI::Range(1, 1024))
      ->capture_default_str();
  app.add_option("--ca-file", ca_file, "PEM bundle used to verify wss:// upstreams")
      ->envname("ZIA_CA_FILE")
      ->capture_default_str();
  app.add_flag("--insecure", insecure, "Do not verify the upstream TLS certificate")->envname("ZIA_INSECURE");
  app.add_option("--log-level", log_level, "Log level: debug | info | warn | error")
      ->envname("ZIA_LOG")
      ->check(log_level_validator())
      ->capture_default_str();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    exit_code = app.exit(e);
    return optional<ClientConfig>();
  }

  // Every value below already passed its validator
  ClientConfig cfg;
  cfg.listen_addr = parse_host_port(listen).value();
  cfg.upstream = parse_url(upstream).value();
  if (!proxy.empty()) {
    cfg.has_proxy = true;
    cfg.proxy = parse_url(proxy).value();
  }
  cfg.connections = connections;
  cfg.tls.ca_file = ca_file;
  cfg.tls.insecure = insecure;
  cfg.log_level = to_level(log_level);

  exit_code = 0;
  return optional<ClientConfig>(std::move(cfg));
}

optional<ServerConfig> parse_server_config(int argc, const char* const* argv, int& exit_code) {
  CLI::App app{"zia-server - relays WebSocket tunnelled datagrams to a UDP upstream"};
  app.set_version_flag("-V,--version", kVersion);

  std::string listen = "0.0.0.0:1234";
  std::string upstream;
  std::string mode = "ws";
  std::string log_level = "info";

  app.add_option("-l,--listen-addr", listen, "TCP address to accept tunnel connections on")
      ->envname("ZIA_LISTEN_ADDR")
      ->check(host_port_validator())
      ->capture_default_str();
  app.add_option("-u,--upstream", upstream, "UDP service to relay datagrams to (host:port)")
      ->envname("ZIA_UPSTREAM")
      ->required()
      ->check(host_port_validator());
  app.add_option("-m,--mode", mode, "Listener mode: ws (WebSocket framed) | tcp (pass-through)")
      ->envname("ZIA_MODE")
      ->check(mode_validator())
      ->capture_default_str();
  app.add_option("--log-level", log_level, "Log level: debug | info | warn | error")
      ->envname("ZIA_LOG")
      ->check(log_level_validator())
      ->capture_default_str();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    exit_code = app.exit(e);
    return optional<ServerConfig>();
  }

  ServerConfig cfg;
  cfg.listen_addr = parse_host_port(listen).value();
  cfg.upstream = parse_host_port(upstream).value();
  parse_listener_mode(mode, cfg.mode);
  cfg.log_level = to_level(log_level);

  exit_code = 0;
  return optional<ServerConfig>(std::move(cfg));
}

}  // namespace zia
