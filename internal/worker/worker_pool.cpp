#include "worker_pool.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"

namespace scout::worker {

WorkerPool::WorkerPool(std::size_t workers) : worker_count_(std::max<std::size_t>(workers, 1)) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) {
    return;
  }
  threads_.reserve(worker_count_);
  for (std::size_t i = 0; i < worker_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Submit(Task task) {
  {
    std::lock_guard lock(idle_mutex_);
    ++pending_;
  }
  queue_.Enqueue(std::move(task));
}

bool WorkerPool::WaitIdle(const util::Deadline& deadline) {
  std::unique_lock lock(idle_mutex_);
  if (deadline.IsNever()) {
    idle_cv_.wait(lock, [&] { return pending_ == 0; });
    return true;
  }
  return idle_cv_.wait_until(lock, deadline.When(), [&] { return pending_ == 0; });
}

std::size_t WorkerPool::DiscardPending() {
  const auto dropped = queue_.Clear();
  if (dropped > 0) {
    std::lock_guard lock(idle_mutex_);
    pending_ -= std::min(pending_, dropped);
  }
  idle_cv_.notify_all();
  return dropped;
}

void WorkerPool::Stop() {
  queue_.Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  running_ = false;
}

void WorkerPool::FinishOne() {
  {
    std::lock_guard lock(idle_mutex_);
    if (pending_ > 0) --pending_;
  }
  idle_cv_.notify_all();
}

void WorkerPool::Run() {
  for (;;) {
    auto task = queue_.Dequeue();
    if (!task) break;

    const auto now_active = ++active_;
    auto       peak       = peak_active_.load();
    while (now_active > peak && !peak_active_.compare_exchange_weak(peak, now_active)) {
    }

    try {
      (*task)();
    } catch (const std::exception& e) {
      SCOUT_LOG_WARN("worker task failed", {observability::StringField("error", e.what())});
    }

    --active_;
    FinishOne();
  }
}

} // namespace scout::worker
