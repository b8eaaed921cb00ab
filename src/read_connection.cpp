#include "zia/read_connection.hpp"

#include "zia/log.hpp"

#include <string>
#include <utility>

namespace zia {

ReadConnection::ReadConnection(WebSocket read, std::shared_ptr<sockpp::udp_socket> socket,
                               std::shared_ptr<PeerAddressTracker> peer)
    : read_(std::move(read)), socket_(std::move(socket)), peer_(std::move(peer)) {}

expected<void, ErrorCode> ReadConnection::run() {
  while (true) {
    auto event = read_.recv();
    if (!event.has_value()) {
      ErrorCode err = event.get_error();
      if (err == ErrorCode::kConnectionClosed) {
        ZIA_LOG_INFO("Upstream connection closed");
      } else {
        ZIA_LOG_WARN(std::string("Websocket read failed: ") + to_string(err));
      }
      return expected<void, ErrorCode>::error(err);
    }

    if (event.value().is_close()) {
      ZIA_LOG_INFO("Websocket closed by peer (" + std::to_string(event.value().code) + " " + event.value().reason +
                   ")");
      return expected<void, ErrorCode>::success();
    }

    forward(event.value().data);
  }
}

void ReadConnection::forward(const std::vector<uint8_t>& payload) {
  auto addr = peer_->get();
  if (!addr.has_value()) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    ZIA_LOG_WARN("No peer address known yet, dropping " + std::to_string(payload.size()) + " bytes");
    return;
  }

  ssize_t n = socket_->send_to(payload.data(), payload.size(), addr.value());
  if (n < 0 || static_cast<size_t>(n) != payload.size()) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    ZIA_LOG_WARN("Unable to send datagram to " + addr.value().to_string() + ": " + socket_->last_error_str());
    return;
  }
  forwarded_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace zia
