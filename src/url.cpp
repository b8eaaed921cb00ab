#include "zia/url.hpp"

#include <cctype>

#include <string>
#include <utility>

namespace zia {

namespace {

uint16_t default_port(const std::string& scheme) {
  if (scheme == "ws" || scheme == "http") {
    return 80;
  }
  if (scheme == "wss") {
    return 443;
  }
  return 0;
}

bool known_scheme(const std::string& scheme) {
  return scheme == "ws" || scheme == "wss" || scheme == "http" || scheme == "tcp" || scheme == "udp";
}

// 1..65535, digits only
bool parse_port(std::string_view text, uint16_t& out) {
  if (text.empty() || text.size() > 5) {
    return false;
  }
  uint32_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  if (value == 0 || value > 65535) {
    return false;
  }
  out = static_cast<uint16_t>(value);
  return true;
}

// Splits host[:port] and [v6]:port. port stays 0 when absent.
bool split_authority(std::string_view authority, Url& url) {
  std::string_view host;
  std::string_view port;

  if (!authority.empty() && authority.front() == '[') {
    size_t close = authority.find(']');
    if (close == std::string_view::npos) {
      return false;
    }
    host = authority.substr(1, close - 1);
    std::string_view rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        return false;
      }
      port = rest.substr(1);
      if (port.empty()) {
        return false;
      }
    }
  } else {
    size_t colon = authority.rfind(':');
    if (colon == std::string_view::npos) {
      host = authority;
    } else {
      host = authority.substr(0, colon);
      port = authority.substr(colon + 1);
      if (port.empty()) {
        return false;
      }
    }
  }

  if (host.empty()) {
    return false;
  }
  url.host = std::string(host);
  if (!port.empty() && !parse_port(port, url.port)) {
    return false;
  }
  return true;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string percent_decode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      int hi = hex_value(text[i + 1]);
      int lo = hex_value(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

std::string Url::authority() const {
  if (is_ipv6()) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

std::string Url::to_string() const { return scheme + "://" + authority() + path; }

expected<Url, ErrorCode> parse_url(std::string_view text) {
  using Result = expected<Url, ErrorCode>;

  size_t sep = text.find("://");
  if (sep == std::string_view::npos || sep == 0) {
    return Result::error(ErrorCode::kInvalidUrl);
  }

  Url url;
  for (char c : text.substr(0, sep)) {
    url.scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (!known_scheme(url.scheme)) {
    return Result::error(ErrorCode::kInvalidUrl);
  }

  std::string_view rest = text.substr(sep + 3);
  size_t slash = rest.find('/');
  std::string_view authority = rest.substr(0, slash);
  if (slash != std::string_view::npos) {
    url.path = std::string(rest.substr(slash));
  }

  size_t at = authority.rfind('@');
  if (at != std::string_view::npos) {
    url.userinfo = std::string(authority.substr(0, at));
    authority = authority.substr(at + 1);
  }

  if (!split_authority(authority, url)) {
    return Result::error(ErrorCode::kInvalidUrl);
  }
  if (url.port == 0) {
    url.port = default_port(url.scheme);
    if (url.port == 0) {
      return Result::error(ErrorCode::kInvalidUrl);
    }
  }
  return Result::success(std::move(url));
}

expected<Url, ErrorCode> parse_host_port(std::string_view text) {
  using Result = expected<Url, ErrorCode>;

  Url url;
  url.scheme = "udp";
  if (text.find('/') != std::string_view::npos || !split_authority(text, url) || url.port == 0) {
    return Result::error(ErrorCode::kInvalidUrl);
  }
  return Result::success(std::move(url));
}

}  // namespace zia
