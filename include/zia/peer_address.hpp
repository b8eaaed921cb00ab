#ifndef ZIA_PEER_ADDRESS_HPP_
#define ZIA_PEER_ADDRESS_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <sockpp/inet_address.h>

namespace zia {

// ============================================================================
// PeerAddressTracker - Last observed UDP peer, shared by both directions
// ============================================================================
//
// The outbound loop records the source of every datagram; the inbound path
// reads it to know where decoded payloads go. Writes are rare (the peer
// seldom moves), so the check runs under the shared lock and the exclusive
// lock is only taken when the address actually changes.

class PeerAddressTracker {
 public:
  PeerAddressTracker() = default;

  explicit PeerAddressTracker(const sockpp::inet_address& initial) : addr_(initial), known_(true) {}

  PeerAddressTracker(const PeerAddressTracker&) = delete;
  PeerAddressTracker& operator=(const PeerAddressTracker&) = delete;

  // Records addr if it differs from the current one. Returns true if written.
  bool update(const sockpp::inet_address& addr) {
    {
      std::shared_lock<std::shared_mutex> lock(mutex_);
      if (known_ && same(addr_, addr)) {
        return false;
      }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    // Another writer may have stored the same address in between
    if (known_ && same(addr_, addr)) {
      return false;
    }
    addr_ = addr;
    known_ = true;
    writes_.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  optional<sockpp::inet_address> get() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!known_) {
      return optional<sockpp::inet_address>();
    }
    return optional<sockpp::inet_address>(addr_);
  }

  bool has_address() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return known_;
  }

  // Number of times the stored address was replaced.
  uint64_t writes() const { return writes_.load(std::memory_order_relaxed); }

 private:
  static bool same(const sockpp::inet_address& a, const sockpp::inet_address& b) {
    return a.address() == b.address() && a.port() == b.port();
  }

  mutable std::shared_mutex mutex_;
  sockpp::inet_address addr_;
  bool known_ = false;
  std::atomic<uint64_t> writes_{0};
};

}  // namespace zia

#endif  // ZIA_PEER_ADDRESS_HPP_
