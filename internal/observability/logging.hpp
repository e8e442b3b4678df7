#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace kiosk::runtime::config {
class RuntimeConfig;
}

namespace kiosk::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const kiosk::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace kiosk::observability

#define KIOSK_LOG_DEBUG(message, ...) ::kiosk::observability::LogDebug((message), ##__VA_ARGS__)
#define KIOSK_LOG_INFO(message, ...) ::kiosk::observability::LogInfo((message), ##__VA_ARGS__)
#define KIOSK_LOG_WARN(message, ...) ::kiosk::observability::LogWarn((message), ##__VA_ARGS__)
#define KIOSK_LOG_ERROR(message, ...) ::kiosk::observability::LogError((message), ##__VA_ARGS__)
