#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace assetdiff::runtime::config {
class RuntimeConfig;
}

namespace assetdiff::observability {

/*
  Tracing and metrics facade.

  Backed by OpenTelemetry when built with ENABLE_OTEL; otherwise every call
  below is an inline no-op so call sites never need their own #ifdefs.
*/

bool InitializeTracing(const assetdiff::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const assetdiff::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // kind: "diff" | "cleanup"; outcome: "success" | "failure"
  void RecordJob(std::string_view kind, std::string_view outcome);
  void ObserveJobDurationMs(std::string_view kind, double duration_ms);
  // asset: "sprite" | "map"
  void ObserveRenderDurationMs(std::string_view asset, double duration_ms);
  void SetQueueDepth(std::uint64_t pending);
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const assetdiff::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const assetdiff::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordJob(std::string_view, std::string_view) {
}

inline void Metrics::ObserveJobDurationMs(std::string_view, double) {
}

inline void Metrics::ObserveRenderDurationMs(std::string_view, double) {
}

inline void Metrics::SetQueueDepth(std::uint64_t) {
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}
#endif

} // namespace assetdiff::observability
