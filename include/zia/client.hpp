#ifndef ZIA_CLIENT_HPP_
#define ZIA_CLIENT_HPP_

#include "config.hpp"
#include "peer_address.hpp"
#include "read_connection.hpp"
#include "tls.hpp"
#include "vocabulary.hpp"
#include "write_pool.hpp"

#include <cstddef>
#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <sockpp/udp_socket.h>
#include <thread>
#include <vector>

namespace zia {

// ============================================================================
// Client - UDP listener tunnelling to a WebSocket upstream
// ============================================================================
//
// One supervisor thread per connection slot keeps an upstream connection
// alive: connect, upgrade, split, hand the write half to the write pool and
// serve the read half until it drops, then reconnect.

class Client {
 public:
  // Binds the UDP listen address. Throws std::runtime_error on failure.
  explicit Client(ClientConfig config, WritePoolOptions pool_options = WritePoolOptions());
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  // Blocks until stop() or a UDP socket failure.
  expected<void, ErrorCode> run();

  // Thread-safe.
  void stop();

  sockpp::inet_address local_address() const { return socket_->address(); }

  const WritePool& write_pool() const { return *pool_; }

 private:
  void supervise(size_t slot);
  bool run_session(size_t slot);

  // Sleeps or returns early on stop(). Returns false once stopping.
  bool wait_retry(std::chrono::milliseconds delay);

  ClientConfig config_;
  std::shared_ptr<sockpp::udp_socket> socket_;
  std::shared_ptr<PeerAddressTracker> peer_;
  std::shared_ptr<TlsContext> tls_;
  std::unique_ptr<WritePool> pool_;

  std::vector<std::thread> supervisors_;
  std::atomic<bool> stopping_{false};

  std::mutex mutex_;
  std::condition_variable cv_;
  std::set<ReadConnection*> readers_;  // sessions in progress, guarded by mutex_
};

}  // namespace zia

#endif  // ZIA_CLIENT_HPP_
