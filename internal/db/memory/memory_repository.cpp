#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace elevator::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertElevator(Transaction& t, const model::ElevatorRecord& r) {
  auto& w = TX(t).Writes();
  if (w.inserted.contains(r.id) || w.updated.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  {
    std::scoped_lock lock(mutex_);
    if (committed_.elevators.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  }
  w.inserted[r.id] = r;
  return Result::Ok();
}

std::optional<model::ElevatorRecord> MemoryRepository::GetElevator(Transaction& t, const std::string& id) {
  const auto& w = TX(t).Writes();
  if (auto it = w.updated.find(id); it != w.updated.end()) return it->second;
  if (auto it = w.inserted.find(id); it != w.inserted.end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto             it = committed_.elevators.find(id);
  if (it == committed_.elevators.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ElevatorRecord> MemoryRepository::ListElevators(Transaction& t) {
  const auto& w = TX(t).Writes();

  std::unordered_map<std::string, model::ElevatorRecord> merged;
  {
    std::scoped_lock lock(mutex_);
    merged = committed_.elevators;
  }
  for (const auto& [id, record] : w.inserted) merged[id] = record;
  for (const auto& [id, record] : w.updated) merged[id] = record;

  std::vector<model::ElevatorRecord> records;
  records.reserve(merged.size());
  for (auto& [_, record] : merged) {
    records.push_back(std::move(record));
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    return a.position != b.position ? a.position < b.position : a.id < b.id;
  });
  return records;
}

Result MemoryRepository::UpdateElevator(Transaction& t, const model::ElevatorRecord& r) {
  auto& w = TX(t).Writes();
  if (auto it = w.inserted.find(r.id); it != w.inserted.end()) {
    const auto position = it->second.position;
    it->second          = r;
    it->second.position = position;
    return Result::Ok();
  }

  // position is fixed at insert time
  uint32_t position = 0;
  if (auto it = w.updated.find(r.id); it != w.updated.end()) {
    position = it->second.position;
  } else {
    std::scoped_lock lock(mutex_);
    auto             committed = committed_.elevators.find(r.id);
    if (committed == committed_.elevators.end()) return Result::Err(ErrorCode::NotFound, r.id);
    position = committed->second.position;
  }

  auto& row    = w.updated[r.id];
  row          = r;
  row.position = position;
  return Result::Ok();
}

Result MemoryRepository::AppendEvent(Transaction& t, const model::EventRecord& r) {
  TX(t).Writes().events.push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ListEvents(Transaction& t, const std::optional<std::string>& elevator_id, uint32_t limit) {
  std::vector<model::EventRecord> all;
  {
    std::scoped_lock lock(mutex_);
    all = committed_.events;
  }
  const auto& pending = TX(t).Writes().events;
  all.insert(all.end(), pending.begin(), pending.end());

  // newest first, insertion order breaks timestamp ties
  std::reverse(all.begin(), all.end());
  std::stable_sort(all.begin(), all.end(), [](const auto& a, const auto& b) { return a.timestamp_ms > b.timestamp_ms; });

  std::vector<model::EventRecord> out;
  for (auto& e : all) {
    if (out.size() >= limit) break;
    if (elevator_id && e.elevator_id != *elevator_id) continue;
    out.push_back(std::move(e));
  }
  return out;
}

} // namespace elevator::db::memory
