#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "internal/util/errors.hpp"
#include "task_queue.hpp"

namespace masterplan::runtime {

/*
  Fixed set of threads draining one TaskQueue.

  Two pools exist in the service:
      jobs   → one publish / tile-generation pipeline per task
      encode → CPU-bound resampling and tile encoding

  Keeping them apart stops a burst of publishes from starving encoders.
*/
class WorkerPool {
 public:
  WorkerPool(std::string name, size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  // Drains queued tasks, then joins.
  void Stop();

  template <typename F>
  auto Submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
    using R   = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    auto fut  = task->get_future();
    if (!queue_.Enqueue([task] { (*task)(); })) {
      throw util::InvalidState("worker pool '" + name_ + "' is stopped");
    }
    return fut;
  }

  size_t Threads() const {
    return thread_count_;
  }

  const std::string& Name() const {
    return name_;
  }

 private:
  void Run();

  std::string              name_;
  size_t                   thread_count_;
  TaskQueue                queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace masterplan::runtime
