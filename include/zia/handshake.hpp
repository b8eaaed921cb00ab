#ifndef ZIA_HANDSHAKE_HPP_
#define ZIA_HANDSHAKE_HPP_

#include "stream.hpp"
#include "url.hpp"
#include "vocabulary.hpp"

#include <cstddef>

#include <string>
#include <string_view>

namespace zia {

// ============================================================================
// HTTP/1.1 Upgrade handshake (RFC 6455 section 4)
// ============================================================================

// Upper bound on a request or response head, terminator included.
static constexpr size_t kMaxHttpHeadSize = 8192;

// base64(sha1(key + GUID))
std::string generate_accept_key(std::string_view client_key);

// Fresh base64-encoded 16-byte nonce.
std::string generate_client_key();

// Reads up to and including the blank line, one byte at a time so that
// nothing after the head is consumed.
expected<std::string, ErrorCode> read_http_head(ByteStream& stream, size_t max_size = kMaxHttpHeadSize);

// Case-insensitive header lookup; value with surrounding blanks trimmed.
// Empty when the header is missing.
std::string_view find_header(std::string_view head, std::string_view name);

// Status code from an HTTP/1.x status line, 0 if malformed.
int parse_status_code(std::string_view head);

// Validates a GET Upgrade request and returns its Sec-WebSocket-Key.
expected<std::string, ErrorCode> parse_handshake_request(std::string_view head);

std::string build_handshake_request(const Url& url, std::string_view client_key);

std::string build_handshake_response(std::string_view client_key);

// Checks the 101 status, Upgrade and Sec-WebSocket-Accept headers.
expected<void, ErrorCode> verify_handshake_response(std::string_view head, std::string_view client_key);

// Client side: send request, verify response.
expected<void, ErrorCode> client_handshake(ByteStream& stream, const Url& url);

// Server side: read request, send 101 (or 400 on a malformed request).
expected<void, ErrorCode> server_handshake(ByteStream& stream);

}  // namespace zia

#endif  // ZIA_HANDSHAKE_HPP_
