#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace elevator::runtime::config {
class RuntimeConfig;
}

namespace elevator::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);

// elevator_id=<id>
LogField UnitField(std::string_view elevator_id);
// <key>=<floor>, the key names which floor (floor, from_floor, target_floor)
LogField FloorField(std::string_view key, int floor);

/*
  Two loggers share one stdout sink:

    service   requests, calls, config changes, heals, lifecycle
    movement  one line per floor reached and per door phase

  Each has its own level (logging.level / logging.movement_level, overridden
  by ELEVATOR_LOG_LEVEL / ELEVATOR_LOG_MOVEMENT_LEVEL). Before
  InitializeLogging movement lines go to the default logger at debug.
*/
enum class Channel {
  kService,
  kMovement,
};

void InitializeLogging(const elevator::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(Channel channel, spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(Channel::kService, spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(Channel::kService, spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(Channel::kService, spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(Channel::kService, spdlog::level::err, message, fields);
}

inline void LogMovement(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(Channel::kMovement, spdlog::level::info, message, fields);
}

} // namespace elevator::observability

#define ELEVATOR_LOG_DEBUG(message, ...) ::elevator::observability::LogDebug((message), ##__VA_ARGS__)
#define ELEVATOR_LOG_INFO(message, ...) ::elevator::observability::LogInfo((message), ##__VA_ARGS__)
#define ELEVATOR_LOG_WARN(message, ...) ::elevator::observability::LogWarn((message), ##__VA_ARGS__)
#define ELEVATOR_LOG_ERROR(message, ...) ::elevator::observability::LogError((message), ##__VA_ARGS__)
#define ELEVATOR_LOG_MOVEMENT(message, ...) ::elevator::observability::LogMovement((message), ##__VA_ARGS__)
