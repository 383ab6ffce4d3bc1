#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "executor.hpp"

namespace favorites::runtime {

/*
  Thread-safe blocking queue of due-time ordered tasks.

  Tasks with the same due time run in submission order.
  After Shutdown() only tasks that are already due are handed out.
*/
class TaskQueue {
 public:
  using SteadyClock = std::chrono::steady_clock;

  void Enqueue(Task task, SteadyClock::time_point due = SteadyClock::now());

  // blocking wait
  std::optional<Task> Dequeue();

  // waits at most until deadline
  std::optional<Task> DequeueUntil(SteadyClock::time_point deadline);

  // due task or nothing, never blocks
  std::optional<Task> TryDequeue();

  void Shutdown();
  bool IsShutdown() const;

  std::size_t Size() const;

 private:
  struct Entry {
    SteadyClock::time_point due;
    std::uint64_t           sequence = 0;
    Task                    task;
  };

  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.due != b.due) return a.due > b.due;
      return a.sequence > b.sequence;
    }
  };

  std::optional<Task> PopDueLocked(SteadyClock::time_point now);

  mutable std::mutex                                 mutex_;
  std::condition_variable                            cv_;
  std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
  std::uint64_t                                      next_sequence_ = 0;
  bool                                               shutdown_      = false;
};

} // namespace favorites::runtime
