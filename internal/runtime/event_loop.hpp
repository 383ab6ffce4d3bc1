#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "executor.hpp"
#include "task_queue.hpp"

namespace favorites::runtime {

/*
  The interactive context.

  Tasks run only on the thread that drains the loop, one at a time.
  Everything UI-visible (cursor swaps, notifications, change events,
  share invocations) is posted here.
*/
class EventLoop final : public Executor {
 public:
  EventLoop();

  void Post(Task task) override;
  void PostDelayed(Task task, std::chrono::milliseconds delay) override;

  // Runs every task that is due, including tasks they post. Returns the count.
  std::size_t RunUntilIdle();

  // Runs tasks until done() holds or the timeout expires. Returns done().
  bool RunUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout);

  // Runs until Quit().
  void Run();
  void Quit();

 private:
  void RunTask(const Task& task);

  std::shared_ptr<TaskQueue> queue_;
};

} // namespace favorites::runtime
