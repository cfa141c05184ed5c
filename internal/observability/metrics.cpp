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
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace pipeline::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// views into the caller's strings, which outlive the Add/Record call
opentelemetry::nostd::string_view Attr(std::string_view value) {
  return {value.data(), value.size()};
}

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name},
                                        {"pipeline.workspace_id", config.workspace_id},
                                        {"pipeline.store.backend", config.store_backend}};
  return resource::Resource::Create(attrs);
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> operation_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      operation_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> job_outcome_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> persistence_conflict_count;
};

bool InitializeMetrics(const pipeline::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config, OtlpSignal::kMetrics);
  const auto& endpoint   = otlp_config.endpoint;

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.export_interval_ms);
  auto reader                           = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           BuildResource(otlp_config));
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
  impl_->meter  = provider->GetMeter("pipeline-store", "0.1.0");

  impl_->operation_count      = impl_->meter->CreateUInt64Counter("pipeline.operation.count", "1", "Total number of store operations");
  impl_->operation_latency_ms = impl_->meter->CreateDoubleHistogram("pipeline.operation.latency_ms", "ms", "Store operation latency in milliseconds");
  impl_->job_outcome_count    = impl_->meter->CreateUInt64Counter("pipeline.job.outcome.count", "1", "Job lifecycle transitions by kind and outcome");
  impl_->persistence_conflict_count =
      impl_->meter->CreateUInt64Counter("pipeline.persistence.conflict.count", "1", "Optimistic write conflicts that forced a retry");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view op, bool success) {
  if (!impl_ || !impl_->operation_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"op", Attr(op)}, {"success", success}};
  AddWithAttributes(impl_->operation_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveOperationLatencyMs(std::string_view op, double latency_ms) {
  if (!impl_ || !impl_->operation_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"op", Attr(op)}};
  RecordWithAttributes(impl_->operation_latency_ms, latency_ms, attributes);
}

void Metrics::RecordJobOutcome(std::string_view kind, std::string_view outcome) {
  if (!impl_ || !impl_->job_outcome_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"kind", Attr(kind)}, {"outcome", Attr(outcome)}};
  AddWithAttributes(impl_->job_outcome_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordPersistenceConflict(std::string_view backend) {
  if (!impl_ || !impl_->persistence_conflict_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"backend", Attr(backend)}};
  AddWithAttributes(impl_->persistence_conflict_count, static_cast<std::uint64_t>(1), attributes);
}

} // namespace pipeline::observability

#endif
