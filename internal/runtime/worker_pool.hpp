#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "executor.hpp"
#include "task_queue.hpp"

namespace favorites::runtime {

/*
  Background context: a fixed set of threads draining one TaskQueue.

  Used for all store access and file I/O. A task that throws is logged
  and the worker moves on.
*/
class WorkerPool final : public Executor {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool() override;

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  void Post(Task task) override;
  void PostDelayed(Task task, std::chrono::milliseconds delay) override;

 private:
  void Run();

  std::size_t                thread_count_;
  std::shared_ptr<TaskQueue> queue_;
  std::vector<std::thread>   threads_;
  std::atomic<bool>          running_{false};
};

} // namespace favorites::runtime
