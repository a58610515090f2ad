#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace masterplan::runtime {

using Task = std::function<void()>;

/*
  Thread-safe blocking queue feeding a WorkerPool.

  Enqueue after Shutdown() is rejected; Dequeue drains what is left and
  then returns nullopt.
*/
class TaskQueue {
 public:
  // false once shut down
  bool Enqueue(Task task);

  // blocking wait
  std::optional<Task> Dequeue();

  void Shutdown();

  size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace masterplan::runtime
