#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"

namespace masterplan::runtime {

WorkerPool::WorkerPool(std::string name, size_t threads) : name_(std::move(name)), thread_count_(threads == 0 ? 1 : threads) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;
  threads_.reserve(thread_count_);
  for (size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
  MASTERPLAN_LOG_INFO("worker pool started", {observability::StringField("pool", name_), observability::IntField("threads", thread_count_)});
}

void WorkerPool::Stop() {
  queue_.Shutdown();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
  running_ = false;
}

void WorkerPool::Run() {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task) break;

    // packaged_task stores exceptions in the future; anything escaping
    // here came from a bare Task.
    try {
      (*task)();
    } catch (const std::exception& e) {
      MASTERPLAN_LOG_ERROR("worker task failed", {observability::StringField("pool", name_), observability::StringField("error", e.what())});
    }
  }
}

} // namespace masterplan::runtime
