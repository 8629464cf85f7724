#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace scout::worker {

using Task = std::function<void()>;

/*
  Thread-safe blocking queue feeding the worker pool.
*/
class TaskQueue {
 public:
  void Enqueue(Task task);

  // Blocks until a task is available; nullopt once shut down and drained.
  std::optional<Task> Dequeue();

  // Drops every queued task, returns how many were dropped.
  std::size_t Clear();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace scout::worker
