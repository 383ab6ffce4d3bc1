#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"

namespace favorites::runtime {

WorkerPool::WorkerPool(std::size_t threads)
    : thread_count_(threads == 0 ? 1 : threads),
      queue_(std::make_shared<TaskQueue>()) {}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Stop() {
  queue_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable())
      thread.join();
  }
  threads_.clear();
}

void WorkerPool::Post(Task task) {
  queue_->Enqueue(std::move(task));
}

void WorkerPool::PostDelayed(Task task, std::chrono::milliseconds delay) {
  queue_->Enqueue(std::move(task), TaskQueue::SteadyClock::now() + delay);
}

void WorkerPool::Run() {
  while (true) {

    auto task = queue_->Dequeue();
    if (!task)
      break;

    try {
      (*task)();
    }
    catch (const std::exception& e) {
      FAVORITES_LOG_ERROR("Background task failed", {observability::StringField("error", e.what())});
    }
  }
}

}
