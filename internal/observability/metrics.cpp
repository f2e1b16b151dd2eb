#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <cstdlib>

#include "config/config.pb.h"

namespace assetdiff::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Attribute values only borrow; callers' views outlive each Add/Record call.
opentelemetry::nostd::string_view View(std::string_view value) {
  return opentelemetry::nostd::string_view(value.data(), value.size());
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const assetdiff::runtime::config::ObservabilityConfig& observability) {
  std::string endpoint = observability.otlp_endpoint();
  if (endpoint.empty()) {
    if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
      endpoint = env;
    }
  }

  if (observability.transport() == assetdiff::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint.empty() ? "http://localhost:4318/v1/metrics" : endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint = endpoint.empty() ? "localhost:4317" : endpoint;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> job_count;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      job_duration_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      render_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      request_latency_ms;

  std::atomic<std::int64_t> queue_depth{0};
};

bool InitializeMetrics(const assetdiff::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(observability.collection_interval_ms() > 0 ? observability.collection_interval_ms() : 5000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(observability), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(
      std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
      opentelemetry::sdk::resource::Resource::Create({{"service.name", std::string("assetdiff")}}));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("assetdiff", "0.1.0");

  impl_->job_count          = impl_->meter->CreateUInt64Counter("assetdiff.job.count", "Jobs processed by the worker", "1");
  impl_->job_duration_ms    = impl_->meter->CreateDoubleHistogram("assetdiff.job.duration_ms", "Job processing time", "ms");
  impl_->render_duration_ms = impl_->meter->CreateDoubleHistogram("assetdiff.render.duration_ms", "Per-file render time", "ms");
  impl_->request_count      = impl_->meter->CreateUInt64Counter("assetdiff.rpc.count", "Intake RPCs by route and result", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("assetdiff.rpc.latency_ms", "Intake RPC latency", "ms");
  impl_->queue_depth_gauge  = impl_->meter->CreateInt64ObservableGauge("assetdiff.queue.pending", "Uncommitted queue entries", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->queue_depth.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordJob(std::string_view kind, std::string_view outcome) {
  const std::initializer_list<AttributePair> attributes = {{"kind", View(kind)}, {"outcome", View(outcome)}};
  impl_->job_count->Add(1, attributes);
}

void Metrics::ObserveJobDurationMs(std::string_view kind, double duration_ms) {
  const std::initializer_list<AttributePair> attributes = {{"kind", View(kind)}};
  impl_->job_duration_ms->Record(duration_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::ObserveRenderDurationMs(std::string_view asset, double duration_ms) {
  const std::initializer_list<AttributePair> attributes = {{"asset", View(asset)}};
  impl_->render_duration_ms->Record(duration_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::SetQueueDepth(std::uint64_t pending) {
  impl_->queue_depth.store(static_cast<std::int64_t>(pending));
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::initializer_list<AttributePair> attributes = {{"route", View(route)}, {"success", success}};
  impl_->request_count->Add(1, attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::initializer_list<AttributePair> attributes = {{"route", View(route)}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

} // namespace assetdiff::observability

#endif
