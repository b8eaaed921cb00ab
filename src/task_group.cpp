#include "zia/task_group.hpp"

#include "zia/log.hpp"

#include <exception>
#include <string>
#include <utility>

namespace zia {

TaskGroup::TaskGroup(size_t workers, size_t max_pending) : max_pending_(max_pending) {
  if (workers == 0) {
    workers = 1;
  }
  workers_.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    workers_.emplace_back(&TaskGroup::worker_loop, this);
  }
}

TaskGroup::~TaskGroup() { shutdown(ShutdownMode::kAbandon); }

bool TaskGroup::spawn(Job job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || queue_.size() >= max_pending_) {
      rejected_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    queue_.push_back(std::move(job));
  }
  cv_.notify_one();
  return true;
}

void TaskGroup::shutdown(ShutdownMode mode) {
  std::deque<Job> abandoned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
    if (mode == ShutdownMode::kAbandon) {
      abandoned.swap(queue_);
    }
  }
  cv_.notify_all();

  if (!abandoned.empty()) {
    ZIA_LOG_DEBUG("TaskGroup: abandoning " + std::to_string(abandoned.size()) + " queued jobs");
  }
  // Destroyed here, outside the lock; a job may own resources that
  // return themselves to a pool
  abandoned.clear();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

size_t TaskGroup::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void TaskGroup::worker_loop() {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      // In await mode the queue is drained before workers exit
      if (queue_.empty()) {
        return;
      }
      job = std::move(queue_.front());
      queue_.pop_front();
    }

    try {
      job();
    } catch (const std::exception& e) {
      ZIA_LOG_ERROR(std::string("TaskGroup: job failed: ") + e.what());
    }
    job = nullptr;
    completed_.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace zia
