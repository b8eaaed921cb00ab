#ifndef ZIA_SERVER_HPP_
#define ZIA_SERVER_HPP_

#include "config.hpp"
#include "peer_address.hpp"
#include "stream.hpp"
#include "vocabulary.hpp"
#include "write_pool.hpp"

#include <cstddef>
#include <cstdint>

#include <atomic>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/udp_socket.h>
#include <thread>

namespace zia {

// ============================================================================
// ServerStats - Connection counters
// ============================================================================

struct alignas(kCacheLine) ServerStats {
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> rejected_handshakes{0};

  void reset() {
    total_connections = 0;
    active_connections = 0;
    rejected_handshakes = 0;
  }
};

// ============================================================================
// Server - TCP listener relaying to a UDP upstream
// ============================================================================
//
// WebSocket mode shares one UDP socket and one write pool across all tunnel
// connections; the upstream is the only peer. Pass-through mode gives every
// connection its own UDP socket connected to the upstream.

class Server {
 public:
  // Binds the TCP listener. Throws std::runtime_error on failure.
  explicit Server(ServerConfig config, WritePoolOptions pool_options = WritePoolOptions());
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Accept loop; blocks until stop() or a listener failure.
  expected<void, ErrorCode> run();

  // Thread-safe.
  void stop();

  sockpp::inet_address local_address() const { return acceptor_.address(); }

  const ServerStats& stats() const { return stats_; }

  ListenerMode mode() const { return config_.mode; }

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  // Dispatches on the listener mode.
  void serve_connection(uint64_t id, sockpp::tcp_socket sock);
  void serve_websocket(uint64_t id, std::unique_ptr<TcpStream> stream);
  void serve_pass_through(uint64_t id, std::unique_ptr<TcpStream> stream);

  // Registers a way to unblock connection id. False if already stopping.
  bool track(uint64_t id, std::function<void()> cancel);
  void untrack(uint64_t id);

  void reap_workers(bool all);

  ServerConfig config_;
  sockpp::inet_address upstream_;
  sockpp::tcp_acceptor acceptor_;

  // kWebSocket only
  std::shared_ptr<sockpp::udp_socket> socket_;
  std::shared_ptr<PeerAddressTracker> peer_;
  std::unique_ptr<WritePool> pool_;
  std::thread pool_thread_;

  std::atomic<bool> stopping_{false};
  std::mutex mutex_;
  std::map<uint64_t, std::function<void()>> cancels_;  // guarded by mutex_
  std::list<Worker> workers_;                          // accept thread only
  uint64_t next_id_ = 1;

  ServerStats stats_;
};

}  // namespace zia

#endif  // ZIA_SERVER_HPP_
