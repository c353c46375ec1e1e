#pragma once

#include <spdlog/common.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace bridge::runtime::config {
class RuntimeConfig;
}

namespace bridge::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Addresses, hashes and trace ids, lowercase hex without prefix.
LogField HexField(std::string_view key, const std::uint8_t* data, std::size_t size);

template <std::size_t N>
LogField HexField(std::string_view key, const std::array<std::uint8_t, N>& value) {
  return HexField(key, value.data(), N);
}

// Logs with level/pattern from the runtime config, overridable through
// BRIDGE_LOG_LEVEL, BRIDGE_LOG_PATTERN and BRIDGE_LOG_INCLUDE_TRACE_CONTEXT.
void InitializeLogging(const bridge::runtime::config::RuntimeConfig& config);
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

} // namespace bridge::observability

#define BRIDGE_LOG_DEBUG(message, ...) ::bridge::observability::LogDebug((message), ##__VA_ARGS__)
#define BRIDGE_LOG_INFO(message, ...) ::bridge::observability::LogInfo((message), ##__VA_ARGS__)
#define BRIDGE_LOG_WARN(message, ...) ::bridge::observability::LogWarn((message), ##__VA_ARGS__)
#define BRIDGE_LOG_ERROR(message, ...) ::bridge::observability::LogError((message), ##__VA_ARGS__)
