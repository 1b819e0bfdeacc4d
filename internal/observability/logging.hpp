#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace streamgate::runtime::config {
class RuntimeConfig;
}

namespace streamgate::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs the "streamgate" stdout logger as spdlog's default.
// STREAMGATE_LOG_LEVEL / STREAMGATE_LOG_PATTERN override the config.
void InitializeLogging(const streamgate::runtime::config::RuntimeConfig& config);
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

} // namespace streamgate::observability

#define STREAMGATE_LOG_DEBUG(message, ...) ::streamgate::observability::LogDebug((message), ##__VA_ARGS__)
#define STREAMGATE_LOG_INFO(message, ...) ::streamgate::observability::LogInfo((message), ##__VA_ARGS__)
#define STREAMGATE_LOG_WARN(message, ...) ::streamgate::observability::LogWarn((message), ##__VA_ARGS__)
#define STREAMGATE_LOG_ERROR(message, ...) ::streamgate::observability::LogError((message), ##__VA_ARGS__)
