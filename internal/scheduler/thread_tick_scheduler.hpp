#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "tick_scheduler.hpp"

namespace elevator::scheduler {

/*
  TickScheduler backed by a deadline-ordered queue and a fixed worker pool.

  Tasks due at the same instant run in scheduling order when a single worker
  is configured; with several workers only the dequeue order is guaranteed.
*/
class ThreadTickScheduler final : public TickScheduler {
 public:
  explicit ThreadTickScheduler(std::size_t worker_threads = 4);
  ~ThreadTickScheduler() override;

  ThreadTickScheduler(const ThreadTickScheduler&)            = delete;
  ThreadTickScheduler& operator=(const ThreadTickScheduler&) = delete;

  void Start();

  uint64_t    Epoch() const override;
  bool        ScheduleAfter(uint64_t epoch, Duration delay, Task task) override;
  std::size_t CancelAll() override;
  std::size_t Pending() const override;
  void        Shutdown() override;

 private:
  using Clock = std::chrono::steady_clock;
  using Key   = std::pair<Clock::time_point, uint64_t>;

  struct Entry {
    uint64_t epoch = 0;
    Task     task;
  };

  void Run();

  const std::size_t worker_threads_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::map<Key, Entry>    queue_;
  uint64_t                epoch_    = 0;
  uint64_t                next_seq_ = 0;
  bool                    started_  = false;
  bool                    shutdown_ = false;

  std::vector<std::thread> workers_;
};

} // namespace elevator::scheduler
