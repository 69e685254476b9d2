#include <cqa/worker_pool.h>

#include <algorithm>
#include <utility>

namespace cqa {

WorkerPool::WorkerPool(std::size_t thread_count, std::size_t queue_capacity)
    : capacity_(queue_capacity) {
  const auto threads = std::max<std::size_t>(1, thread_count);
  if (capacity_ == 0) {
    capacity_ = threads * 2;
  }
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this]() { WorkerLoop(); });
  }
}

WorkerPool::~WorkerPool() { Shutdown(); }

void WorkerPool::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void WorkerPool::Enqueue(std::function<void()> task) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock,
                   [this]() { return stopping_ || tasks_.size() < capacity_; });
    if (stopping_) {
      throw std::runtime_error("Cannot submit to a stopped worker pool");
    }
    tasks_.push(std::move(task));
  }
  not_empty_.notify_one();
}

void WorkerPool::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      not_empty_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
      if (stopping_ && tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    not_full_.notify_one();
    task();
  }
}

} // namespace cqa
