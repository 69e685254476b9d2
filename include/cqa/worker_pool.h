#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace cqa {

class CancellationToken {
public:
  void Cancel() noexcept { cancelled_.store(true); }
  bool IsCancelled() const noexcept { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

// Fixed-size thread pool with a bounded FIFO queue. Submit blocks while the
// queue is full. Exceptions thrown by a task surface through its future.
class WorkerPool {
public:
  explicit WorkerPool(std::size_t thread_count,
                      std::size_t queue_capacity = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  template <typename F>
  auto Submit(F &&task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using ResultType = std::invoke_result_t<std::decay_t<F>>;
    auto packaged = std::make_shared<std::packaged_task<ResultType()>>(
        std::forward<F>(task));
    auto result = packaged->get_future();
    Enqueue([packaged]() { (*packaged)(); });
    return result;
  }

  // Finishes queued tasks and joins all workers. Idempotent.
  void Shutdown();

  std::size_t ThreadCount() const { return workers_.size(); }
  std::size_t QueueCapacity() const { return capacity_; }

private:
  void Enqueue(std::function<void()> task);
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::size_t capacity_;
  std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  bool stopping_ = false;
};

} // namespace cqa
