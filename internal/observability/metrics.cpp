#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <map>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace chains::observability {
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

} // namespace

bool StartMetrics(const chains::runtime::config::ObservabilityConfig& config) {
  if (!config.metrics_enabled()) {
    return false;
  }

  opentelemetry::exporter::otlp::OtlpGrpcMetricExporterOptions options;
  if (!config.otlp_endpoint().empty()) {
    options.endpoint = config.otlp_endpoint();
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(5000);
  reader_options.export_timeout_millis  = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(
      opentelemetry::exporter::otlp::OtlpGrpcMetricExporterFactory::Create(options), reader_options);

  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", std::string("critical-chains")}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                           opentelemetry::sdk::resource::Resource::Create(attributes));
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void StopMetrics() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

// Instruments are created on first use, so StartMetrics must run before the first call.
struct ChainMetrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>   calls;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>        call_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>   cache_lookups;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<std::uint64_t>> forest_nodes;
};

ChainMetrics::ChainMetrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("critical-chains");

  impl_->calls           = meter->CreateUInt64Counter("chains.calls", "Service calls by route and outcome", "1");
  impl_->call_latency_ms = meter->CreateDoubleHistogram("chains.call.latency_ms", "Service call latency", "ms");
  impl_->cache_lookups   = meter->CreateUInt64Counter("chains.cache.lookups", "Chain cache lookups by outcome", "1");
  impl_->forest_nodes    = meter->CreateUInt64Histogram("chains.forest.nodes", "Nodes in each computed forest", "1");
}

ChainMetrics& ChainMetrics::Instance() {
  static ChainMetrics instance;
  return instance;
}

void ChainMetrics::RecordCall(std::string_view route, bool ok, double latency_ms) {
  const std::map<std::string, std::string> by_route   = {{"route", std::string(route)}};
  const std::map<std::string, std::string> by_outcome = {{"route", std::string(route)}, {"outcome", ok ? "ok" : "error"}};

  impl_->calls->Add(1, by_outcome);
  impl_->call_latency_ms->Record(latency_ms, by_route, opentelemetry::context::Context{});
}

void ChainMetrics::RecordCacheLookup(bool hit) {
  const std::map<std::string, std::string> by_outcome = {{"outcome", hit ? "hit" : "miss"}};
  impl_->cache_lookups->Add(1, by_outcome);
}

void ChainMetrics::RecordForest(std::uint64_t nodes) {
  impl_->forest_nodes->Record(nodes, opentelemetry::context::Context{});
}

} // namespace chains::observability

#endif
