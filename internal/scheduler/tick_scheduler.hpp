#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace elevator::scheduler {

/*
  Timed task executor driving movement chains.

  Every task is scheduled against an epoch. CancelAll() drops all pending
  tasks and advances the epoch; from then on ScheduleAfter() refuses tasks
  carrying an older epoch, so a tick already running when the fleet is
  stopped cannot re-arm itself.
*/
class TickScheduler {
 public:
  using Task     = std::function<void()>;
  using Duration = std::chrono::milliseconds;

  virtual ~TickScheduler() = default;

  virtual uint64_t Epoch() const = 0;

  // false if epoch is stale or the scheduler is shut down.
  virtual bool ScheduleAfter(uint64_t epoch, Duration delay, Task task) = 0;

  // Returns the number of pending tasks dropped.
  virtual std::size_t CancelAll() = 0;

  virtual std::size_t Pending() const = 0;

  virtual void Shutdown() = 0;
};

} // namespace elevator::scheduler
