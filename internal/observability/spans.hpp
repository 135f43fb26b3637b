#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

namespace elevator::runtime::config {
class RuntimeConfig;
}

namespace elevator::observability {

// OTLP export as configured under `observability:`. Return false when the
// section disables it or the binary is built without ELEVATOR_ENABLE_OTEL.
bool InitializeTracing(const elevator::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const elevator::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Active span for one RPC or one movement tick, ended on scope exit.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  // elevator.id, elevator.state and elevator.floor of the unit being moved
  void TagUnit(std::string_view elevator_id, std::string_view state, int floor);
  void RecordException(std::string_view description);

 private:
#ifdef ELEVATOR_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments:

    elevator.request.count / latency_ms   per route
    elevator.engine.tick_duration_ms      per motion state at tick start
    elevator.engine.heal.count            per heal kind
    elevator.queue.pending_stops          gauge per unit
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success, double latency_ms);
  void RecordTick(std::string_view phase, double duration_ms);
  void RecordHeal(std::string_view kind);
  void SetPendingStops(std::string_view elevator_id, std::size_t stops);

 private:
  Metrics();
#ifdef ELEVATOR_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ELEVATOR_ENABLE_OTEL
inline bool InitializeTracing(const elevator::runtime::config::RuntimeConfig&) { return false; }
inline bool InitializeMetrics(const elevator::runtime::config::RuntimeConfig&) { return false; }
inline void ShutdownTracing() {}
inline void ShutdownMetrics() {}

inline SpanScope::SpanScope(std::string_view) {}
inline SpanScope::~SpanScope() {}
inline void SpanScope::TagUnit(std::string_view, std::string_view, int) {}
inline void SpanScope::RecordException(std::string_view) {}

inline Metrics::Metrics() {}
inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}
inline void Metrics::RecordRequest(std::string_view, bool, double) {}
inline void Metrics::RecordTick(std::string_view, double) {}
inline void Metrics::RecordHeal(std::string_view) {}
inline void Metrics::SetPendingStops(std::string_view, std::size_t) {}
#endif

} // namespace elevator::observability
