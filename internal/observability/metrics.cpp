#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "internal/observability/otlp_config.hpp"

namespace fleet::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value,
                       const std::initializer_list<AttributePair>& attributes) {
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, attributes);
  }
}

template <typename Instrument, typename Value>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value,
                          const std::initializer_list<AttributePair>& attributes) {
  if constexpr (requires { instrument->Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transition_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> reaper_expired;
};

bool InitializeMetrics(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(config.metric_interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create({{"service.name", config.service_name}}));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const fleet::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }
  return InitializeMetrics(ToOtlpConfig(config.observability()));
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
  impl_->meter  = provider->GetMeter("fleet-coordinator", "1.0.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("fleet.request.count", "Total number of RPC and HTTP requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("fleet.request.latency_ms", "End-to-end request latency in milliseconds", "ms");
  impl_->transition_count   = impl_->meter->CreateUInt64Counter("fleet.transition.count", "Committed device and action state transitions", "1");
  impl_->reaper_expired     = impl_->meter->CreateUInt64Counter("fleet.reaper.expired.count", "Rows expired or auto-rejected by the reaper", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), {{"route", std::string(route)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, {{"route", std::string(route)}});
}

void Metrics::RecordTransition(std::string_view subject, std::string_view to_state) {
  if (!impl_ || !impl_->transition_count) {
    return;
  }
  AddWithAttributes(impl_->transition_count, static_cast<std::uint64_t>(1),
                    {{"subject", std::string(subject)}, {"to_state", std::string(to_state)}});
}

void Metrics::RecordReaperExpired(std::string_view subject, std::uint64_t count) {
  if (!impl_ || !impl_->reaper_expired || count == 0) {
    return;
  }
  AddWithAttributes(impl_->reaper_expired, count, {{"subject", std::string(subject)}});
}

} // namespace fleet::observability

#endif
