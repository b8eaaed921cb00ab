#include "zia.hpp"

#include <atomic>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace zia;

namespace {

struct Entry {
  explicit Entry(int id) : id(id) {}
  bool is_closed() const { return closed.load(); }

  int id;
  std::atomic<bool> closed{false};
};

using EntryPool = ConnectionPool<Entry>;

std::unique_ptr<Entry> make_entry(int id, bool closed = false) {
  auto entry = std::make_unique<Entry>(id);
  entry->closed = closed;
  return entry;
}

}  // namespace

// ============================================================================
// ConnectionPool
// ============================================================================

TEST_CASE("ConnectionPool - empty pool yields nothing", "[pool]") {
  EntryPool pool;
  REQUIRE(pool.empty());
  REQUIRE_FALSE(pool.acquire().has_value());
  REQUIRE(pool.stats().exhausted == 1);
}

TEST_CASE("ConnectionPool - push then acquire", "[pool]") {
  EntryPool pool;
  pool.push(make_entry(1));
  REQUIRE(pool.size() == 1);

  auto lease = pool.acquire();
  REQUIRE(lease.has_value());
  REQUIRE(lease.value()->id == 1);
  // Exclusive while leased
  REQUIRE(pool.empty());
  REQUIRE_FALSE(pool.acquire().has_value());
}

TEST_CASE("ConnectionPool - lease returns the entry when dropped", "[pool]") {
  EntryPool pool;
  pool.push(make_entry(1));
  {
    auto lease = pool.acquire();
    REQUIRE(lease.has_value());
    REQUIRE(pool.size() == 0);
  }
  REQUIRE(pool.size() == 1);
  REQUIRE(pool.acquire().has_value());
}

TEST_CASE("ConnectionPool - closed entries are never handed out", "[pool]") {
  EntryPool pool;
  pool.push(make_entry(1, true));
  pool.push(make_entry(2));
  pool.push(make_entry(3, true));

  auto lease = pool.acquire();
  REQUIRE(lease.has_value());
  REQUIRE(lease.value()->id == 2);
  REQUIRE(pool.stats().discarded >= 1);

  lease.reset();
  REQUIRE(pool.acquire().has_value());
}

TEST_CASE("ConnectionPool - pool of closed entries drains to empty", "[pool]") {
  EntryPool pool;
  for (int i = 0; i < 5; ++i) {
    pool.push(make_entry(i, true));
  }
  REQUIRE_FALSE(pool.acquire().has_value());
  REQUIRE(pool.empty());
  REQUIRE(pool.stats().discarded == 5);
}

TEST_CASE("ConnectionPool - entry closed while leased is dropped later", "[pool]") {
  EntryPool pool;
  pool.push(make_entry(1));
  {
    auto lease = pool.acquire();
    lease.value()->closed = true;
  }
  REQUIRE(pool.size() == 1);
  REQUIRE_FALSE(pool.acquire().has_value());
  REQUIRE(pool.empty());
}

TEST_CASE("ConnectionPool - returned lease does not shadow closed entries", "[pool]") {
  EntryPool pool;
  pool.push(make_entry(0));

  // A live entry keeps coming back while newer entries close behind it
  for (int i = 1; i <= 1000; ++i) {
    auto live = pool.acquire();
    REQUIRE(live.has_value());
    REQUIRE(live.value()->id == 0);

    auto churned = make_entry(i);
    Entry* raw = churned.get();
    pool.push(std::move(churned));
    raw->closed = true;

    live.reset();
    for (int j = 0; j < 5; ++j) {
      REQUIRE(pool.acquire().has_value());
    }
  }

  REQUIRE(pool.size() == 1);
  REQUIRE(pool.stats().discarded == 1000);
}

TEST_CASE("ConnectionPool - entries are drawn in turn", "[pool]") {
  EntryPool pool;
  for (int i = 0; i < 3; ++i) {
    pool.push(make_entry(i));
  }
  std::vector<int> order;
  for (int i = 0; i < 6; ++i) {
    auto lease = pool.acquire();
    REQUIRE(lease.has_value());
    order.push_back(lease.value()->id);
  }
  REQUIRE(order == std::vector<int>{0, 1, 2, 0, 1, 2});
}

TEST_CASE("ConnectionPool - detach keeps the entry out", "[pool]") {
  EntryPool pool;
  pool.push(make_entry(4));
  std::unique_ptr<Entry> owned;
  {
    auto lease = pool.acquire();
    owned = lease.value().detach();
  }
  REQUIRE(owned);
  REQUIRE(owned->id == 4);
  REQUIRE(pool.empty());
}

TEST_CASE("ConnectionPool - drain removes everything", "[pool]") {
  EntryPool pool;
  pool.push(make_entry(1));
  pool.push(make_entry(2, true));
  auto all = pool.drain();
  REQUIRE(all.size() == 2);
  REQUIRE(pool.empty());
}

TEST_CASE("ConnectionPool - push ignores null", "[pool]") {
  EntryPool pool;
  pool.push(nullptr);
  REQUIRE(pool.empty());
  REQUIRE(pool.stats().pushes == 0);
}

TEST_CASE("ConnectionPool - concurrent leases are exclusive", "[pool]") {
  EntryPool pool;
  constexpr int kEntries = 4;
  for (int i = 0; i < kEntries; ++i) {
    pool.push(make_entry(i));
  }

  std::atomic<int> in_use[kEntries] = {};
  std::atomic<bool> overlap{false};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 500; ++i) {
        auto lease = pool.acquire();
        if (!lease.has_value()) {
          continue;
        }
        int id = lease.value()->id;
        if (in_use[id].fetch_add(1) != 0) {
          overlap = true;
        }
        in_use[id].fetch_sub(1);
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  REQUIRE_FALSE(overlap.load());
  REQUIRE(pool.size() == kEntries);
}
