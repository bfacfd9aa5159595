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
#include <cstdlib>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "config/config.pb.h"

namespace credpool::observability {
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

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
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

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> claim_requested;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> claim_assigned;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> import_entries;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   pool_available_gauge;

  std::mutex                                    pool_available_mutex;
  std::unordered_map<std::string, std::int64_t> pool_available_values;
};

bool InitializeMetrics(const credpool::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == credpool::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                        : OtlpTransport::kGrpc;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms = observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create({{"service.name", otlp_config.service_name}}));
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
  impl_->meter  = provider->GetMeter("credpool", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("credpool.request.count", "Total number of pool operations", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("credpool.request.latency_ms", "Pool operation latency in milliseconds", "ms");
  impl_->claim_requested    = impl_->meter->CreateUInt64Counter("credpool.claim.requested", "Credentials requested by claims", "1");
  impl_->claim_assigned     = impl_->meter->CreateUInt64Counter("credpool.claim.assigned", "Credentials handed out by claims", "1");
  impl_->import_entries     = impl_->meter->CreateUInt64Counter("credpool.import.entries", "Archive entries by import outcome", "1");
  impl_->pool_available_gauge =
      impl_->meter->CreateInt64ObservableGauge("credpool.pool.available", "Available active credentials per pool", "1");
  impl_->pool_available_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->pool_available_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [pool, available] : impl->pool_available_values) {
          const std::initializer_list<AttributePair> attributes = {{"pool", pool}};
          int_result->Observe(available, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::string                          route_name(route);
  const std::initializer_list<AttributePair> attributes = {{"route", route_name}, {"success", success}};
  impl_->request_count->Add(1, attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::string                          route_name(route);
  const std::initializer_list<AttributePair> attributes = {{"route", route_name}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordClaim(std::string_view pool, std::uint64_t requested, std::uint64_t assigned) {
  if (!impl_ || !impl_->claim_requested || !impl_->claim_assigned) {
    return;
  }

  const std::string                          pool_name(pool);
  const std::initializer_list<AttributePair> attributes = {{"pool", pool_name}};
  impl_->claim_requested->Add(requested, attributes);
  impl_->claim_assigned->Add(assigned, attributes);
}

void Metrics::RecordImportEntries(std::string_view outcome, std::uint64_t count) {
  if (!impl_ || !impl_->import_entries || count == 0) {
    return;
  }

  const std::string                          outcome_name(outcome);
  const std::initializer_list<AttributePair> attributes = {{"outcome", outcome_name}};
  impl_->import_entries->Add(count, attributes);
}

void Metrics::SetPoolAvailable(std::string_view pool, std::uint64_t available) {
  if (!impl_ || !impl_->pool_available_gauge) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->pool_available_mutex);
  impl_->pool_available_values[std::string(pool)] = static_cast<std::int64_t>(available);
}

} // namespace credpool::observability

#endif
