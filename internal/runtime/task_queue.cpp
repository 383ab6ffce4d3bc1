#include "task_queue.hpp"

namespace favorites::runtime {

void TaskQueue::Enqueue(Task task, SteadyClock::time_point due) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(Entry{due, next_sequence_++, std::move(task)});
  }
  // waiters may be sleeping until a later due time
  cv_.notify_all();
}

std::optional<Task> TaskQueue::PopDueLocked(SteadyClock::time_point now) {
  if (queue_.empty() || queue_.top().due > now) return std::nullopt;

  Task task = queue_.top().task;
  queue_.pop();
  return task;
}

std::optional<Task> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  while (true) {
    if (auto task = PopDueLocked(SteadyClock::now())) return task;
    if (shutdown_) return std::nullopt;

    if (queue_.empty()) {
      cv_.wait(lock);
    } else {
      cv_.wait_until(lock, queue_.top().due);
    }
  }
}

std::optional<Task> TaskQueue::DequeueUntil(SteadyClock::time_point deadline) {
  std::unique_lock lock(mutex_);

  while (true) {
    const auto now = SteadyClock::now();
    if (auto task = PopDueLocked(now)) return task;
    if (shutdown_ || now >= deadline) return std::nullopt;

    auto wake = deadline;
    if (!queue_.empty() && queue_.top().due < wake) wake = queue_.top().due;
    cv_.wait_until(lock, wake);
  }
}

std::optional<Task> TaskQueue::TryDequeue() {
  std::lock_guard lock(mutex_);
  return PopDueLocked(SteadyClock::now());
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool TaskQueue::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

std::size_t TaskQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace favorites::runtime
