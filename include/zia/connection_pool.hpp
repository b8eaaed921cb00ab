#ifndef ZIA_CONNECTION_POOL_HPP_
#define ZIA_CONNECTION_POOL_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace zia {

static constexpr size_t kCacheLine = 64;

// ============================================================================
// PoolStats - Atomic pool counters
// ============================================================================

struct alignas(kCacheLine) PoolStats {
  std::atomic<uint64_t> pushes{0};
  std::atomic<uint64_t> acquires{0};
  std::atomic<uint64_t> exhausted{0};  // acquire() found nothing usable
  std::atomic<uint64_t> discarded{0};  // closed entries dropped on acquire

  void reset() {
    pushes = 0;
    acquires = 0;
    exhausted = 0;
    discarded = 0;
  }
};

// ============================================================================
// ConnectionPool<T> - Concurrent set of liveness-checked entries
// ============================================================================
//
// T must provide `bool is_closed() const`. Entries are handed out through a
// Lease that gives exclusive use and puts the entry back when destroyed.
// Entries are drawn from the front and returned to the back, so every entry
// is drawn again within one pass over the set. Closed entries are dropped
// when acquire() draws them; nothing else sweeps the set.

template <typename T>
class ConnectionPool {
  static_assert(std::is_same<decltype(std::declval<const T&>().is_closed()), bool>::value,
                "pool entries must provide bool is_closed() const");

 public:
  class Lease {
   public:
    Lease(ConnectionPool* pool, std::unique_ptr<T> entry) : pool_(pool), entry_(std::move(entry)) {}

    Lease(Lease&& other) noexcept : pool_(other.pool_), entry_(std::move(other.entry_)) { other.pool_ = nullptr; }

    Lease& operator=(Lease&& other) noexcept {
      if (this != &other) {
        give_back();
        pool_ = other.pool_;
        entry_ = std::move(other.entry_);
        other.pool_ = nullptr;
      }
      return *this;
    }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    ~Lease() { give_back(); }

    T& operator*() { return *entry_; }
    T* operator->() { return entry_.get(); }
    const T* operator->() const { return entry_.get(); }

    // Takes the entry out of the pool for good.
    std::unique_ptr<T> detach() {
      pool_ = nullptr;
      return std::move(entry_);
    }

   private:
    void give_back() {
      if (pool_ != nullptr && entry_) {
        pool_->push(std::move(entry_));
      }
      pool_ = nullptr;
    }

    ConnectionPool* pool_;
    std::unique_ptr<T> entry_;
  };

  ConnectionPool() = default;
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  void push(std::unique_ptr<T> entry) {
    if (!entry)
      return;
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
    stats_.pushes.fetch_add(1, std::memory_order_relaxed);
  }

  // Returns nothing when no live entry is available.
  optional<Lease> acquire() {
    std::unique_ptr<T> entry;
    // Closed entries are destroyed after the lock is released
    std::vector<std::unique_ptr<T>> dead;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      while (!entries_.empty()) {
        std::unique_ptr<T> candidate = std::move(entries_.front());
        entries_.pop_front();
        if (!candidate->is_closed()) {
          entry = std::move(candidate);
          break;
        }
        dead.push_back(std::move(candidate));
      }
    }

    if (!dead.empty()) {
      stats_.discarded.fetch_add(dead.size(), std::memory_order_relaxed);
    }
    if (!entry) {
      stats_.exhausted.fetch_add(1, std::memory_order_relaxed);
      return optional<Lease>();
    }
    stats_.acquires.fetch_add(1, std::memory_order_relaxed);
    return optional<Lease>(Lease(this, std::move(entry)));
  }

  // Removes every entry, live or not.
  std::vector<std::unique_ptr<T>> drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::unique_ptr<T>> out;
    out.reserve(entries_.size());
    for (auto& entry : entries_) {
      out.push_back(std::move(entry));
    }
    entries_.clear();
    return out;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  bool empty() const { return size() == 0; }

  const PoolStats& stats() const { return stats_; }

 private:
  mutable std::mutex mutex_;
  std::deque<std::unique_ptr<T>> entries_;
  PoolStats stats_;
};

}  // namespace zia

#endif  // ZIA_CONNECTION_POOL_HPP_
