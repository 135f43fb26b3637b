#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ELEVATOR_ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_context.h>
#endif

namespace elevator::observability {
namespace {

constexpr const char* kServiceLogger  = "elevator-dispatch";
constexpr const char* kMovementLogger = "elevator-movement";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v";

bool g_include_trace_context{false};

// Environment wins over the config file, the config file over the fallback.
std::string Resolve(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool ResolveTraceContextEnabled(const elevator::runtime::config::LoggingConfig& logging) {
  if (const char* value = std::getenv("ELEVATOR_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(value) == "1" || std::string(value) == "true";
  }
  return logging.include_trace_context();
}

void AppendTraceContext(fmt::memory_buffer& line) {
#ifdef ELEVATOR_ENABLE_OTEL
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  fmt::format_to(std::back_inserter(line), " trace_id={} span_id={}", std::string_view(trace_id, sizeof(trace_id)),
                 std::string_view(span_id, sizeof(span_id)));
#else
  (void)line;
#endif
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

LogField UnitField(std::string_view elevator_id) {
  return {"elevator_id", std::string(elevator_id)};
}

LogField FloorField(std::string_view key, int floor) {
  return {std::string(key), std::to_string(floor)};
}

void InitializeLogging(const elevator::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();
  const auto  pattern = Resolve("ELEVATOR_LOG_PATTERN", logging.pattern(), kDefaultPattern);

  spdlog::drop(kServiceLogger);
  spdlog::drop(kMovementLogger);

  auto sink     = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto service  = std::make_shared<spdlog::logger>(kServiceLogger, sink);
  auto movement = std::make_shared<spdlog::logger>(kMovementLogger, sink);

  service->set_pattern(pattern);
  service->set_level(spdlog::level::from_str(Resolve("ELEVATOR_LOG_LEVEL", logging.level(), "info")));
  movement->set_pattern(pattern);
  movement->set_level(spdlog::level::from_str(Resolve("ELEVATOR_LOG_MOVEMENT_LEVEL", logging.movement_level(), "off")));

  spdlog::register_logger(movement);
  spdlog::set_default_logger(std::move(service));
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context = ResolveTraceContextEnabled(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(Channel channel, spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger();
  if (channel == Channel::kMovement) {
    if (auto movement = spdlog::get(kMovementLogger)) {
      logger = std::move(movement);
    } else {
      level = spdlog::level::debug;
    }
  }
  if (!logger->should_log(level)) return;

  fmt::memory_buffer line;
  fmt::format_to(std::back_inserter(line), "{}", message);
  for (const auto& field : fields) {
    fmt::format_to(std::back_inserter(line), " {}={}", field.key, field.value);
  }
  AppendTraceContext(line);

  logger->log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace elevator::observability
