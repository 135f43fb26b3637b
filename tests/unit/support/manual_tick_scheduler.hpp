#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>

#include "internal/scheduler/tick_scheduler.hpp"

namespace elevator::testing {

/*
  Deterministic TickScheduler for tests. Nothing runs until RunNext() is
  called; virtual time jumps to each task's deadline.
*/
class ManualTickScheduler final : public scheduler::TickScheduler {
 public:
  uint64_t Epoch() const override {
    return epoch_;
  }

  bool ScheduleAfter(uint64_t epoch, Duration delay, Task task) override {
    if (shutdown_ || epoch != epoch_) return false;
    delays_.push_back(delay);
    queue_.emplace(std::make_pair(now_ + delay, seq_++), Entry{epoch, std::move(task)});
    return true;
  }

  std::size_t CancelAll() override {
    const auto dropped = queue_.size();
    queue_.clear();
    ++epoch_;
    if (on_cancel) on_cancel();
    return dropped;
  }

  std::size_t Pending() const override {
    return queue_.size();
  }

  void Shutdown() override {
    shutdown_ = true;
    queue_.clear();
    ++epoch_;
  }

  bool RunNext() {
    if (queue_.empty()) return false;
    auto node = queue_.extract(queue_.begin());
    now_      = node.key().first;
    if (node.mapped().epoch == epoch_) node.mapped().task();
    return true;
  }

  std::size_t RunAll(std::size_t limit = 1000) {
    std::size_t ran = 0;
    while (ran < limit && RunNext()) ++ran;
    return ran;
  }

  // Runs inside CancelAll() right after the epoch advances.
  std::function<void()> on_cancel;

  Duration                     Now() const { return now_; }
  const std::vector<Duration>& Delays() const { return delays_; }

 private:
  struct Entry {
    uint64_t epoch = 0;
    Task     task;
  };

  std::map<std::pair<Duration, uint64_t>, Entry> queue_;
  std::vector<Duration>                          delays_;
  Duration                                       now_{0};
  uint64_t                                       epoch_    = 0;
  uint64_t                                       seq_      = 0;
  bool                                           shutdown_ = false;
};

} // namespace elevator::testing
