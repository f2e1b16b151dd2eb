#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace assetdiff::observability {
namespace {

std::string ResolveLevel(const assetdiff::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("ASSETDIFF_LOG_LEVEL")) {
    return level;
  }
  if (!config.logging().level().empty()) {
    return config.logging().level();
  }
  return "info";
}

std::string ResolvePattern(const assetdiff::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("ASSETDIFF_LOG_PATTERN")) {
    return pattern;
  }
  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }
  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
}

bool g_include_trace_context{false};

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    // quote values carrying spaces so fields stay parseable
    if (field.value.find(' ') != std::string::npos) {
      out << field.key << "=\"" << field.value << '"';
    } else {
      out << field.key << '=' << field.value;
    }
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return {};
  }

  char trace_id[32];
  char span_id[16];
  span->GetContext().trace_id().ToLowerBase16(trace_id);
  span->GetContext().span_id().ToLowerBase16(span_id);
  return "trace_id=" + std::string(trace_id, sizeof(trace_id)) + " span_id=" + std::string(span_id, sizeof(span_id));
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const assetdiff::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::stdout_color_mt("assetdiff");
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = config.logging().include_trace_context();
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);
  auto trace_fields      = TraceContextFields();

  if (!trace_fields.empty()) {
    serialized_fields += serialized_fields.empty() ? trace_fields : " " + trace_fields;
  }
  if (serialized_fields.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, serialized_fields);
}

} // namespace assetdiff::observability
