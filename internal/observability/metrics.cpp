#include "internal/observability/metrics.hpp"

#ifdef WORKFLOW_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace workflow::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool state_labels_enabled{true};
  bool service_labels_enabled{true};
};

MetricsOptions g_metrics_options;

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

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
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

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transition_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> retry_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> deadletter_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> quota_exceeded_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lease_denied_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      claim_latency_ms;
};

bool InitializeMetrics(const workflow::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == workflow::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto                                       min_interval_ms = metric_config.min_collection_interval_ms();
  const auto configured_interval_ms     = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max(min_interval_ms, configured_interval_ms));
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_metrics_options.state_labels_enabled   = metric_config.state_labels_enabled();
  g_metrics_options.service_labels_enabled = metric_config.service_labels_enabled();
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
  impl_->meter  = provider->GetMeter("workflow-manager", "0.1.0");

  impl_->transition_count     = impl_->meter->CreateUInt64Counter("workflow.transition.count", "1", "Committed state transitions");
  impl_->retry_count          = impl_->meter->CreateUInt64Counter("workflow.retry.count", "1", "Transient failures scheduled for retry");
  impl_->deadletter_count     = impl_->meter->CreateUInt64Counter("workflow.deadletter.count", "1", "Items routed to the dead-letter queue");
  impl_->quota_exceeded_count = impl_->meter->CreateUInt64Counter("workflow.quota_exceeded.count", "1", "Items parked on exhausted quota");
  impl_->lease_denied_count   = impl_->meter->CreateUInt64Counter("workflow.lease.denied.count", "1", "Lease acquisitions refused");
  impl_->claim_latency_ms     = impl_->meter->CreateDoubleHistogram("workflow.claim.latency_ms", "ms", "ClaimNext latency in milliseconds");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordTransition(model::WorkflowState from, model::WorkflowState to) {
  if (!impl_ || !impl_->transition_count) {
    return;
  }

  if (g_metrics_options.state_labels_enabled) {
    const std::string                          from_label(model::ToString(from));
    const std::string                          to_label(model::ToString(to));
    const std::initializer_list<AttributePair> attributes = {{"from", from_label}, {"to", to_label}};
    AddWithAttributes(impl_->transition_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  AddWithAttributes(impl_->transition_count, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::RecordRetry(std::int32_t retry_count) {
  if (!impl_ || !impl_->retry_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"retry_count", static_cast<std::int64_t>(retry_count)}};
  AddWithAttributes(impl_->retry_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordDeadLetter(bool permanent) {
  if (!impl_ || !impl_->deadletter_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"permanent", permanent}};
  AddWithAttributes(impl_->deadletter_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordQuotaExceeded(std::string_view service_name) {
  if (!impl_ || !impl_->quota_exceeded_count) {
    return;
  }

  if (g_metrics_options.service_labels_enabled) {
    const std::string                          service(service_name);
    const std::initializer_list<AttributePair> attributes = {{"service", service}};
    AddWithAttributes(impl_->quota_exceeded_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  AddWithAttributes(impl_->quota_exceeded_count, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::RecordLeaseDenied() {
  if (!impl_ || !impl_->lease_denied_count) {
    return;
  }
  AddWithAttributes(impl_->lease_denied_count, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::ObserveClaimLatencyMs(double latency_ms) {
  if (!impl_ || !impl_->claim_latency_ms) {
    return;
  }
  RecordWithAttributes(impl_->claim_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

} // namespace workflow::observability

#endif
