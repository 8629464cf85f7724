#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/util/time.hpp"
#include "task_queue.hpp"

namespace scout::worker {

/*
  Fixed number of threads draining a TaskQueue.

  At most WorkerCount() tasks run at once. A task that throws is logged
  and counted as finished; it never takes its worker down.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t workers);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  void Submit(Task task);

  // True once every submitted task has finished; false if the deadline came first.
  bool WaitIdle(const util::Deadline& deadline);

  // Drops queued tasks that have not started. Running ones finish normally.
  std::size_t DiscardPending();

  // Joins the workers after the queue drains.
  void Stop();

  std::size_t WorkerCount() const {
    return worker_count_;
  }

  // Highest number of tasks observed running at the same time.
  std::size_t PeakConcurrency() const {
    return peak_active_.load();
  }

 private:
  void Run();
  void FinishOne();

  const std::size_t        worker_count_;
  TaskQueue                queue_;
  std::vector<std::thread> threads_;

  std::mutex              idle_mutex_;
  std::condition_variable idle_cv_;
  std::size_t             pending_ = 0;

  std::atomic<std::size_t> active_{0};
  std::atomic<std::size_t> peak_active_{0};
  std::atomic<bool>        running_{false};
};

} // namespace scout::worker
