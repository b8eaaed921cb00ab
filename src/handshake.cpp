#include "zia/handshake.hpp"

#include "zia/log.hpp"
#include "zia/utils.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstring>

#include <utility>

namespace zia {

namespace {

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

// Comma separated token list, e.g. "keep-alive, Upgrade"
bool has_token(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    size_t comma = value.find(',');
    std::string_view item = value.substr(0, comma);
    while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) {
      item.remove_prefix(1);
    }
    while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) {
      item.remove_suffix(1);
    }
    if (iequals(item, token)) {
      return true;
    }
    if (comma == std::string_view::npos) {
      break;
    }
    value.remove_prefix(comma + 1);
  }
  return false;
}

expected<void, ErrorCode> send_text(ByteStream& stream, const std::string& text) {
  return stream.write_all(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

}  // namespace

std::string generate_accept_key(std::string_view client_key) {
  constexpr std::string_view kMagic = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
  std::string key(client_key);
  key.append(kMagic);

  auto hash = SHA1::compute(reinterpret_cast<const uint8_t*>(key.data()), key.size());
  return Base64::encode(hash.data(), hash.size());
}

std::string generate_client_key() {
  uint8_t nonce[16];
  for (size_t i = 0; i < sizeof(nonce); i += 4) {
    uint32_t r = random_u32();
    std::memcpy(nonce + i, &r, 4);
  }
  return Base64::encode(nonce, sizeof(nonce));
}

expected<std::string, ErrorCode> read_http_head(ByteStream& stream, size_t max_size) {
  using Result = expected<std::string, ErrorCode>;

  std::string head;
  head.reserve(512);
  while (head.size() < max_size) {
    uint8_t c;
    auto got = stream.read_exact(&c, 1);
    if (!got.has_value()) {
      return Result::error(got.get_error());
    }
    head.push_back(static_cast<char>(c));
    if (head.size() >= 4 && head.compare(head.size() - 4, 4, "\r\n\r\n") == 0) {
      return Result::success(std::move(head));
    }
  }
  ZIA_LOG_WARN("HTTP head exceeds " + std::to_string(max_size) + " bytes");
  return Result::error(ErrorCode::kHandshakeFailed);
}

std::string_view find_header(std::string_view head, std::string_view name) {
  // Skip the request/status line
  size_t pos = head.find("\r\n");
  while (pos != std::string_view::npos) {
    pos += 2;
    size_t end = head.find("\r\n", pos);
    if (end == std::string_view::npos || end == pos) {
      break;
    }
    std::string_view line = head.substr(pos, end - pos);
    size_t colon = line.find(':');
    if (colon != std::string_view::npos && iequals(line.substr(0, colon), name)) {
      std::string_view value = line.substr(colon + 1);
      while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
      }
      while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
      }
      return value;
    }
    pos = end;
  }
  return std::string_view();
}

int parse_status_code(std::string_view head) {
  // "HTTP/1.1 101 Switching Protocols"
  if (head.substr(0, 7) != "HTTP/1.") {
    return 0;
  }
  size_t space = head.find(' ');
  if (space == std::string_view::npos || head.size() < space + 4) {
    return 0;
  }
  int code = 0;
  for (size_t i = space + 1; i < space + 4; ++i) {
    char c = head[i];
    if (c < '0' || c > '9') {
      return 0;
    }
    code = code * 10 + (c - '0');
  }
  return code;
}

expected<std::string, ErrorCode> parse_handshake_request(std::string_view head) {
  using Result = expected<std::string, ErrorCode>;

  if (head.substr(0, 4) != "GET ") {
    return Result::error(ErrorCode::kHandshakeFailed);
  }
  if (!iequals(find_header(head, "Upgrade"), "websocket")) {
    return Result::error(ErrorCode::kHandshakeFailed);
  }
  if (!has_token(find_header(head, "Connection"), "Upgrade")) {
    return Result::error(ErrorCode::kHandshakeFailed);
  }
  if (find_header(head, "Sec-WebSocket-Version") != "13") {
    return Result::error(ErrorCode::kHandshakeFailed);
  }

  std::string_view key = find_header(head, "Sec-WebSocket-Key");
  // 16 random bytes, base64 encoded
  if (Base64::decode(key).size() != 16) {
    return Result::error(ErrorCode::kHandshakeFailed);
  }
  return Result::success(std::string(key));
}

std::string build_handshake_request(const Url& url, std::string_view client_key) {
  std::string req;
  req.reserve(256);
  req += "GET " + url.path + " HTTP/1.1\r\n";
  req += "Host: " + url.authority() + "\r\n";
  req += "Upgrade: websocket\r\n";
  req += "Connection: Upgrade\r\n";
  req += "Sec-WebSocket-Key: ";
  req.append(client_key.data(), client_key.size());
  req += "\r\n";
  req += "Sec-WebSocket-Version: 13\r\n";
  req += "\r\n";
  return req;
}

std::string build_handshake_response(std::string_view client_key) {
  std::string accept_key = generate_accept_key(client_key);

  // 34 + 20 + 21 + 22 + 28 + 4 bytes
  char buf[256];
  int len = snprintf(buf, sizeof(buf),
                     "HTTP/1.1 101 Switching Protocols\r\n"
                     "Upgrade: websocket\r\n"
                     "Connection: Upgrade\r\n"
                     "Sec-WebSocket-Accept: %s\r\n"
                     "\r\n",
                     accept_key.c_str());
  return std::string(buf, static_cast<size_t>(len));
}

expected<void, ErrorCode> verify_handshake_response(std::string_view head, std::string_view client_key) {
  int status = parse_status_code(head);
  if (status != 101) {
    ZIA_LOG_ERROR("Upstream refused the upgrade (status " + std::to_string(status) + ")");
    return expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  }
  if (!iequals(find_header(head, "Upgrade"), "websocket")) {
    ZIA_LOG_ERROR("Upstream response lacks Upgrade: websocket");
    return expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  }
  if (find_header(head, "Sec-WebSocket-Accept") != generate_accept_key(client_key)) {
    ZIA_LOG_ERROR("Upstream sent a wrong Sec-WebSocket-Accept");
    return expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> client_handshake(ByteStream& stream, const Url& url) {
  std::string key = generate_client_key();

  auto sent = send_text(stream, build_handshake_request(url, key));
  if (!sent.has_value()) {
    return sent;
  }

  auto head = read_http_head(stream);
  if (!head.has_value()) {
    return expected<void, ErrorCode>::error(head.get_error());
  }
  return verify_handshake_response(head.value(), key);
}

expected<void, ErrorCode> server_handshake(ByteStream& stream) {
  auto head = read_http_head(stream);
  if (!head.has_value()) {
    return expected<void, ErrorCode>::error(head.get_error());
  }

  auto key = parse_handshake_request(head.value());
  if (!key.has_value()) {
    ZIA_LOG_WARN("Rejecting malformed upgrade request");
    auto rejected = send_text(stream, "HTTP/1.1 400 Bad Request\r\nConnection: close\r\nContent-Length: 0\r\n\r\n");
    if (!rejected.has_value()) {
      ZIA_LOG_DEBUG("Unable to send 400 response");
    }
    return expected<void, ErrorCode>::error(key.get_error());
  }

  return send_text(stream, build_handshake_response(key.value()));
}

}  // namespace zia
