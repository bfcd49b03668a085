#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <string>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace faultline::observability {
namespace {

constexpr const char* kLoggerName     = "faultline";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// Environment first, then the config value, then the built-in default.
std::string EnvOr(const char* variable, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(variable)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool TraceContextRequested(const faultline::runtime::config::RuntimeConfig& config) {
  const char* value = std::getenv("FAULTLINE_LOG_INCLUDE_TRACE_CONTEXT");
  if (value == nullptr) {
    return config.logging().include_trace_context();
  }
  const std::string_view text(value);
  return text == "1" || text == "true";
}

// Metadata values often carry spaces ("connection reset by peer"), so
// anything that would break k=v tokenization is quoted.
bool NeedsQuoting(std::string_view value) {
  return value.empty() || value.find_first_of(" \t\n\"=") != std::string_view::npos;
}

template <typename Out>
void AppendValue(Out out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    fmt::format_to(out, "{}", value);
    return;
  }
  *out++ = '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      *out++ = '\\';
      *out++ = c;
    } else if (c == '\n') {
      *out++ = '\\';
      *out++ = 'n';
    } else {
      *out++ = c;
    }
  }
  *out++ = '"';
}

#ifdef ENABLE_OTEL
template <typename Out>
void AppendTraceContext(Out out) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_hex[32];
  char span_hex[16];
  context.trace_id().ToLowerBase16(trace_hex);
  context.span_id().ToLowerBase16(span_hex);
  fmt::format_to(out, " trace_id={} span_id={}", std::string_view(trace_hex, sizeof(trace_hex)),
                 std::string_view(span_hex, sizeof(span_hex)));
}
#else
template <typename Out>
void AppendTraceContext(Out) {
}
#endif

template <typename Fields>
void LogWithFields(spdlog::level::level_enum level, std::string_view message, const Fields& fields) {
  auto logger = ActiveLogger();
  if (!logger || !logger->should_log(level)) {
    return;
  }

  fmt::memory_buffer line;
  auto               out = std::back_inserter(line);
  fmt::format_to(out, "{}", message);
  for (const auto& field : fields) {
    fmt::format_to(out, " {}=", field.key);
    AppendValue(out, field.value);
  }
  AppendTraceContext(out);

  logger->log(level, "{}", fmt::to_string(line));
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), fmt::format("{}", value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), fmt::format("{}", value)};
}

std::shared_ptr<spdlog::logger> ActiveLogger() {
  if (auto logger = spdlog::get(kLoggerName)) {
    return logger;
  }
  return spdlog::default_logger();
}

void InitializeLogging(const faultline::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(EnvOr("FAULTLINE_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("FAULTLINE_LOG_LEVEL", config.logging().level(), "info")));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = TraceContextRequested(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  LogWithFields(level, message, fields);
}

void Log(spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& fields) {
  LogWithFields(level, message, fields);
}

} // namespace faultline::observability
