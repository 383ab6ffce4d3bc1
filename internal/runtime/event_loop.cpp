#include "event_loop.hpp"

#include "internal/observability/logging.hpp"

namespace favorites::runtime {

EventLoop::EventLoop() : queue_(std::make_shared<TaskQueue>()) {
}

void EventLoop::Post(Task task) {
  queue_->Enqueue(std::move(task));
}

void EventLoop::PostDelayed(Task task, std::chrono::milliseconds delay) {
  queue_->Enqueue(std::move(task), TaskQueue::SteadyClock::now() + delay);
}

void EventLoop::RunTask(const Task& task) {
  try {
    task();
  } catch (const std::exception& e) {
    FAVORITES_LOG_ERROR("Main loop task failed", {observability::StringField("error", e.what())});
  }
}

std::size_t EventLoop::RunUntilIdle() {
  std::size_t ran = 0;
  while (auto task = queue_->TryDequeue()) {
    RunTask(*task);
    ++ran;
  }
  return ran;
}

bool EventLoop::RunUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
  const auto deadline = TaskQueue::SteadyClock::now() + timeout;

  while (!done()) {
    auto task = queue_->DequeueUntil(deadline);
    if (!task) {
      return done();
    }
    RunTask(*task);
  }
  return true;
}

void EventLoop::Run() {
  while (auto task = queue_->Dequeue()) {
    RunTask(*task);
  }
}

void EventLoop::Quit() {
  queue_->Shutdown();
}

} // namespace favorites::runtime
