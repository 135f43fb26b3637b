#include "thread_tick_scheduler.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace elevator::scheduler {

ThreadTickScheduler::ThreadTickScheduler(std::size_t worker_threads) : worker_threads_(std::max<std::size_t>(worker_threads, 1)) {
}

ThreadTickScheduler::~ThreadTickScheduler() {
  Shutdown();
}

void ThreadTickScheduler::Start() {
  std::lock_guard lock(mutex_);
  if (started_) return;
  if (shutdown_) throw std::runtime_error("tick scheduler already shut down");

  started_ = true;
  workers_.reserve(worker_threads_);
  for (std::size_t i = 0; i < worker_threads_; ++i) {
    workers_.emplace_back(&ThreadTickScheduler::Run, this);
  }
}

uint64_t ThreadTickScheduler::Epoch() const {
  std::lock_guard lock(mutex_);
  return epoch_;
}

bool ThreadTickScheduler::ScheduleAfter(uint64_t epoch, Duration delay, Task task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || epoch != epoch_) return false;

    const auto due = Clock::now() + std::max(delay, Duration::zero());
    queue_.emplace(Key{due, next_seq_++}, Entry{epoch, std::move(task)});
  }
  cv_.notify_one();
  return true;
}

std::size_t ThreadTickScheduler::CancelAll() {
  std::lock_guard lock(mutex_);
  const auto      dropped = queue_.size();
  queue_.clear();
  ++epoch_;
  return dropped;
}

std::size_t ThreadTickScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void ThreadTickScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ && workers_.empty()) return;
    shutdown_ = true;
    queue_.clear();
    ++epoch_;
  }
  cv_.notify_all();

  const auto self = std::this_thread::get_id();
  for (auto& worker : workers_) {
    if (worker.get_id() == self) {
      worker.detach();
    } else if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

void ThreadTickScheduler::Run() {
  std::unique_lock lock(mutex_);

  while (!shutdown_) {
    if (queue_.empty()) {
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      continue;
    }

    const auto due = queue_.begin()->first.first;
    if (Clock::now() < due) {
      cv_.wait_until(lock, due);
      continue;
    }

    auto node = queue_.extract(queue_.begin());
    if (node.mapped().epoch != epoch_) continue;

    lock.unlock();
    try {
      node.mapped().task();
    } catch (const std::exception& e) {
      ELEVATOR_LOG_ERROR("tick task failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace elevator::scheduler
