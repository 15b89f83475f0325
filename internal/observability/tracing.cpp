#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <string>
#include <utility>

#include "config/config.pb.h"

namespace chains::observability {
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider> g_provider;

opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  return trace_api::Provider::GetTracerProvider()->GetTracer("critical-chains");
}

} // namespace

bool StartTracing(const chains::runtime::config::ObservabilityConfig& config) {
  if (!config.tracing_enabled()) {
    return false;
  }

  opentelemetry::exporter::otlp::OtlpGrpcExporterOptions options;
  if (!config.otlp_endpoint().empty()) {
    options.endpoint = config.otlp_endpoint();
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(
      opentelemetry::exporter::otlp::OtlpGrpcExporterFactory::Create(options), sdktrace::BatchSpanProcessorOptions{});
  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", std::string("critical-chains")}};
  auto resource = opentelemetry::sdk::resource::Resource::Create(attributes);

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), resource));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  return true;
}

void StopTracing() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

struct CallSpan::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> started) : span(std::move(started)), scope(span) {
  }
};

CallSpan::CallSpan(std::string_view route) : impl_(std::make_unique<Impl>(Tracer()->StartSpan(std::string(route)))) {
}

CallSpan::~CallSpan() {
  impl_->span->End();
}

void CallSpan::SetRecordCount(std::int64_t records) {
  impl_->span->SetAttribute("chains.records", records);
}

void CallSpan::Fail(std::string_view error) {
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(error));
}

} // namespace chains::observability

#endif
