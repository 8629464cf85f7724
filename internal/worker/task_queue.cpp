#include "task_queue.hpp"

namespace scout::worker {

void TaskQueue::Enqueue(Task task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<Task> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

std::size_t TaskQueue::Clear() {
  std::lock_guard lock(mutex_);
  const auto      dropped = queue_.size();
  std::queue<Task>().swap(queue_);
  return dropped;
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t TaskQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace scout::worker
