#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace fleet::observability {
namespace {

constexpr char kLoggerName[]     = "fleet-coordinator";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  if (value != nullptr && *value != '\0') {
    return value;
  }
  return fallback;
}

bool ParseFlag(const std::string& value) {
  return value == "1" || value == "true" || value == "yes";
}

#ifdef ENABLE_OTEL
void AppendHex(std::string& out, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  out += out.empty() ? "" : " ";
  out += "trace_id=";
  AppendHex(out, trace_bytes, sizeof(trace_bytes));
  out += " span_id=";
  AppendHex(out, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const fleet::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  const auto level   = EnvOr("FLEET_LOG_LEVEL", logging.level().empty() ? "info" : logging.level());
  const auto pattern = EnvOr("FLEET_LOG_PATTERN", logging.pattern().empty() ? kDefaultPattern : logging.pattern());
  const auto trace   = EnvOr("FLEET_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "false");

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(pattern);
  logger->set_level(spdlog::level::from_str(level));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context.store(ParseFlag(trace), std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  std::string suffix;
  for (const auto& field : fields) {
    if (!suffix.empty()) {
      suffix.push_back(' ');
    }
    suffix += field.key;
    suffix.push_back('=');
    suffix += field.value;
  }
  AppendTraceContext(suffix);

  if (suffix.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, suffix);
  }
}

} // namespace fleet::observability
