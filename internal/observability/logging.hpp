#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace commute::runtime::config {
class RuntimeConfig;
}

namespace commute::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);

void InitializeLogging(const commute::runtime::config::RuntimeConfig& config);
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

} // namespace commute::observability

#define COMMUTE_LOG_DEBUG(message, ...) ::commute::observability::LogDebug((message), ##__VA_ARGS__)
#define COMMUTE_LOG_INFO(message, ...) ::commute::observability::LogInfo((message), ##__VA_ARGS__)
#define COMMUTE_LOG_WARN(message, ...) ::commute::observability::LogWarn((message), ##__VA_ARGS__)
#define COMMUTE_LOG_ERROR(message, ...) ::commute::observability::LogError((message), ##__VA_ARGS__)
