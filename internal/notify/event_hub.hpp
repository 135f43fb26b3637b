#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

#include "notifier.hpp"

namespace elevator::notify {

using Update = std::variant<model::Elevator, model::ElevatorEvent>;

/*
  One observer's bounded mailbox. When full, the oldest update is discarded
  and counted.
*/
class Subscription {
 public:
  explicit Subscription(std::size_t capacity);

  // Blocks up to timeout. nullopt on timeout or once closed and drained.
  std::optional<Update> Next(std::chrono::milliseconds timeout);

  // Updates discarded since the last call.
  uint64_t TakeDropped();

  void Close();
  bool Closed() const;

 private:
  friend class EventHub;

  void Push(const Update& update);

  const std::size_t capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Update>      updates_;
  uint64_t                dropped_ = 0;
  bool                    closed_  = false;
};

class EventHub final : public Notifier {
 public:
  static constexpr std::size_t kDefaultQueueCapacity = 1024;

  explicit EventHub(std::size_t queue_capacity = kDefaultQueueCapacity);
  ~EventHub() override;

  std::shared_ptr<Subscription> Subscribe();
  void                          Unsubscribe(const std::shared_ptr<Subscription>& subscription);

  std::size_t SubscriberCount() const;

  // Closes every subscription; later subscribers start closed.
  void Shutdown();

  void PublishElevatorChanged(const model::Elevator& elevator) override;
  void PublishEvent(const model::ElevatorEvent& event) override;

 private:
  void Broadcast(const Update& update);

  const std::size_t queue_capacity_;

  mutable std::mutex                         mutex_;
  std::vector<std::shared_ptr<Subscription>> subscribers_;
  bool                                       shutdown_ = false;
};

} // namespace elevator::notify
