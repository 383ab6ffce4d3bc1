#pragma once

#include <chrono>
#include <functional>

namespace favorites::runtime {

using Task = std::function<void()>;

/*
  An execution context.

  Two kinds exist in the process:
    WorkerPool  - background context for store access and file I/O
    EventLoop   - the single interactive context that publishes results

  Post() never blocks the caller.
*/
class Executor {
 public:
  virtual ~Executor() = default;

  virtual void Post(Task task) = 0;

  virtual void PostDelayed(Task task, std::chrono::milliseconds delay) = 0;
};

} // namespace favorites::runtime
