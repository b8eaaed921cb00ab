#ifndef ZIA_TASK_GROUP_HPP_
#define ZIA_TASK_GROUP_HPP_

#include <cstddef>
#include <cstdint>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace zia {

enum class ShutdownMode : uint8_t {
  kAwait,    // run every queued job, then join
  kAbandon,  // drop queued jobs, join once running jobs return
};

// ============================================================================
// TaskGroup - Bounded worker threads for fire-and-forget jobs
// ============================================================================
//
// Jobs never report back to the spawner. A job that throws is logged and
// the worker keeps going.

class TaskGroup {
 public:
  using Job = std::function<void()>;

  TaskGroup(size_t workers, size_t max_pending);
  ~TaskGroup();

  TaskGroup(const TaskGroup&) = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;

  // Queues a job. Returns false (job destroyed unrun) when the queue is full
  // or the group is shut down.
  bool spawn(Job job);

  // Idempotent; the first call decides the mode.
  void shutdown(ShutdownMode mode);

  size_t pending() const;
  size_t worker_count() const { return workers_.size(); }
  uint64_t completed() const { return completed_.load(std::memory_order_relaxed); }
  uint64_t rejected() const { return rejected_.load(std::memory_order_relaxed); }

 private:
  void worker_loop();

  const size_t max_pending_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> queue_;
  std::vector<std::thread> workers_;
  bool stopping_ = false;

  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> rejected_{0};
};

}  // namespace zia

#endif  // ZIA_TASK_GROUP_HPP_
