#include "event_hub.hpp"

#include <algorithm>
#include <utility>

namespace elevator::notify {

Subscription::Subscription(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {
}

std::optional<Update> Subscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return closed_ || !updates_.empty(); });

  if (updates_.empty()) return std::nullopt;

  Update update = std::move(updates_.front());
  updates_.pop_front();
  return update;
}

uint64_t Subscription::TakeDropped() {
  std::lock_guard lock(mutex_);
  return std::exchange(dropped_, 0);
}

void Subscription::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Subscription::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

void Subscription::Push(const Update& update) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    if (updates_.size() >= capacity_) {
      updates_.pop_front();
      ++dropped_;
    }
    updates_.push_back(update);
  }
  cv_.notify_one();
}

EventHub::EventHub(std::size_t queue_capacity) : queue_capacity_(queue_capacity) {
}

EventHub::~EventHub() {
  Shutdown();
}

std::shared_ptr<Subscription> EventHub::Subscribe() {
  auto subscription = std::make_shared<Subscription>(queue_capacity_);

  std::lock_guard lock(mutex_);
  if (shutdown_) {
    subscription->Close();
    return subscription;
  }
  subscribers_.push_back(subscription);
  return subscription;
}

void EventHub::Unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  if (!subscription) return;
  subscription->Close();

  std::lock_guard lock(mutex_);
  subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), subscription), subscribers_.end());
}

std::size_t EventHub::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

void EventHub::Shutdown() {
  std::vector<std::shared_ptr<Subscription>> subscribers;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    subscribers.swap(subscribers_);
  }
  for (auto& subscription : subscribers) {
    subscription->Close();
  }
}

void EventHub::PublishElevatorChanged(const model::Elevator& elevator) {
  Broadcast(Update{elevator});
}

void EventHub::PublishEvent(const model::ElevatorEvent& event) {
  Broadcast(Update{event});
}

void EventHub::Broadcast(const Update& update) {
  std::vector<std::shared_ptr<Subscription>> subscribers;
  {
    std::lock_guard lock(mutex_);
    subscribers = subscribers_;
  }
  for (auto& subscription : subscribers) {
    subscription->Push(update);
  }
}

} // namespace elevator::notify
