#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace faultline::runtime::config {
class RuntimeConfig;
}

namespace faultline::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField UintField(std::string_view key, std::uint64_t value);

// Creates (or reuses) the "faultline" stdout logger and makes it the default.
// FAULTLINE_LOG_LEVEL / FAULTLINE_LOG_PATTERN override the config.
void InitializeLogging(const faultline::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Logger error events go to; the default logger once InitializeLogging ran.
std::shared_ptr<spdlog::logger> ActiveLogger();

// One line: `message k=v k="v with spaces"`, fields in the order given and
// trace_id/span_id appended when trace context is enabled.
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});
void Log(spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& fields);

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace faultline::observability

#define FAULTLINE_LOG_INFO(message, ...) ::faultline::observability::LogInfo((message), ##__VA_ARGS__)
#define FAULTLINE_LOG_WARN(message, ...) ::faultline::observability::LogWarn((message), ##__VA_ARGS__)
#define FAULTLINE_LOG_ERROR(message, ...) ::faultline::observability::LogError((message), ##__VA_ARGS__)
